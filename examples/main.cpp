#include "poolkit/poolkit.hpp"

#include <glog/logging.h>

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace {

const char kBufferPool[] = "poolkit.demo.buffers";

// Render a request into a pooled scratch buffer and return its length.
std::size_t RenderRequest(poolkit::memory::ObjectPool<std::string>* pool, int worker, int seq) {
  poolkit::memory::ObjectPool<std::string>::Handle buf =
      pool->AcquireOrInit([]() {
        std::string s;
        s.reserve(256);
        return s;
      });
  buf->append("worker=");
  buf->append(std::to_string(worker));
  buf->append(" seq=");
  buf->append(std::to_string(seq));
  return buf->size();
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "config/poolkit.json";

  poolkit::api::Status st = poolkit::log::LogManager::Init(argv[0], config_path);
  if (!st.ok()) {
    std::fprintf(stderr, "Init failed: %s\n", st.ToString().c_str());
    return 1;
  }

  st = poolkit::memory::GlobalAllocator::ConfigureFromFile(config_path);
  if (!st.ok()) {
    LOG(ERROR) << "allocator config rejected: " << st.ToString();
    poolkit::log::LogManager::Shutdown();
    return 1;
  }
  LOG(INFO) << "allocator backend: " << poolkit::memory::GlobalAllocator::CurrentBackendName();

  poolkit::memory::ObjectPoolOptions options;
  poolkit::api::Result<poolkit::memory::ObjectPoolOptions> loaded =
      poolkit::memory::LoadObjectPoolOptions(config_path, kBufferPool);
  if (loaded.ok()) {
    options = loaded.value();
  } else {
    LOG(WARNING) << "using default pool options: " << loaded.status().ToString();
    options.name = kBufferPool;
  }

  {
    poolkit::memory::ObjectPool<std::string> pool(options);
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
      workers.push_back(std::thread([&pool, w]() {
        std::size_t bytes = 0;
        for (int i = 0; i < 1000; ++i) bytes += RenderRequest(&pool, w, i);
        VLOG(1) << "worker " << w << " rendered " << bytes << " bytes";
      }));
    }
    for (std::size_t i = 0; i < workers.size(); ++i) workers[i].join();

    const poolkit::memory::PoolStats stats = pool.Stats();
    LOG(INFO) << pool.name() << ": created=" << stats.created << " reused=" << stats.reused
              << " recycled=" << stats.recycled << " discarded=" << stats.discarded
              << " stored=" << pool.Size();

    pool.Truncate(1);
    LOG(INFO) << pool.name() << ": stored after trim=" << pool.Size();
  }

  const poolkit::memory::AllocatorStats mem = poolkit::memory::GlobalAllocator::CurrentStats();
  LOG(INFO) << "allocator: allocs=" << mem.alloc_count << " frees=" << mem.free_count
            << " peak_bytes=" << mem.bytes_peak;

  poolkit::log::LogManager::Shutdown();
  return 0;
}
