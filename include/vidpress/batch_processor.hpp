/**
 * @file batch_processor.hpp
 * @brief Parallel compression of a directory of inputs
 *
 * @details The BatchProcessor runs many requests through one
 *          CompressionService:
 *
 *          - Spawns N worker threads (PARALLEL_STREAMS, 0 = CPU limit)
 *
 *          - Workers pull files from a shared queue, one request at a time
 *
 *          - Logging is worker-prefixed for clarity
 *
 *          - A summary table is printed once every worker has joined
 *
 * @note Each transcode is its own process; workers only wait on it. The
 *       cgroup-aware CPU limit keeps N from oversubscribing a container.
 */

#ifndef VIDPRESS_BATCH_PROCESSOR_HPP
#define VIDPRESS_BATCH_PROCESSOR_HPP

#include <atomic>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "service.hpp"

namespace vidpress {

/**
 * @struct BatchItemResult
 * @brief Result from processing a single file in a batch.
 */
struct BatchItemResult {
  std::string filename;    //< Input filename
  bool success = false;    //< Whether the request succeeded
  nlohmann::json payload;  //< Response or error document
  long processing_time_us = 0; //< Wall time of handle() in microseconds
};

/**
 * @brief Supported media files directly inside a directory, sorted by name.
 */
std::vector<std::string> collect_inputs(const std::string &input_dir,
                                        const Settings &settings);

/**
 * @class BatchProcessor
 * @brief Fans requests out over a fixed pool of worker threads.
 */
class BatchProcessor {
public:
  /**
   * @param service Shared request handler
   * @param num_workers Worker threads (0 = detected CPU limit)
   */
  BatchProcessor(const CompressionService &service, int num_workers = 0);

  /**
   * @brief Process all files with the same options document.
   * @return Number of failures (0 = all succeeded)
   */
  int process(const std::vector<std::string> &input_files,
              const std::string &options_json);

  /// Per-file results in completion order
  const std::vector<BatchItemResult> &results() const { return results_; }

  int num_workers() const { return num_workers_; }

private:
  const CompressionService &service_;
  int num_workers_;
  int total_files_{0};

  std::mutex queue_mutex_;             //< Protects work queue
  std::queue<std::string> work_queue_; //< Files to process
  std::atomic<int> files_done_{0};     //< Counter for progress

  std::mutex results_mutex_;             //< Protects results vector
  std::vector<BatchItemResult> results_; //< Collected results

  bool get_next_file(std::string &file);
  void worker(int worker_id, const std::string &options_json);

  /**
   * @brief Print final batch summary to stderr.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec) const;
};

} // namespace vidpress

#endif // VIDPRESS_BATCH_PROCESSOR_HPP
