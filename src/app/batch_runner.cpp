#include <infergate/app/batch_runner.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>

namespace infergate::app {

std::vector<PredictResponse> run_batch_parallel(Dispatcher& dispatcher,
                                                const std::vector<Json::Value>& requests,
                                                int workers) {
  std::vector<PredictResponse> responses(requests.size());
  if (requests.empty()) return responses;

  const auto body = [&dispatcher, &requests, &responses] {
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, requests.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                        for (std::size_t i = range.begin(); i != range.end(); ++i) {
                          responses[i] = dispatcher.handle(requests[i]);
                        }
                      });
  };

  if (workers > 0) {
    tbb::task_arena arena(workers);
    arena.execute(body);
  } else {
    body();
  }
  return responses;
}

}  // namespace infergate::app
