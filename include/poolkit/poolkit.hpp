#pragma once

#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"
#include "poolkit/json/json_codec.hpp"
#include "poolkit/log/log_manager.hpp"
#include "poolkit/memory/global_allocator.hpp"
#include "poolkit/memory/global_stl_allocator.hpp"
#include "poolkit/memory/iallocator.hpp"
#include "poolkit/memory/object_pool.hpp"
#include "poolkit/memory/pool_options.hpp"
#include "poolkit/memory/sanitizer.hpp"
