#pragma once

#include <infergate/app/dispatcher.hpp>
#include <json/value.h>
#include <vector>

namespace infergate::app {

/// Runs boundary requests concurrently with TBB and returns their responses in
/// request order. workers > 0 bounds concurrency with a task_arena; 0 uses the
/// TBB default.
std::vector<PredictResponse> run_batch_parallel(Dispatcher& dispatcher,
                                                const std::vector<Json::Value>& requests,
                                                int workers = 0);

}  // namespace infergate::app
