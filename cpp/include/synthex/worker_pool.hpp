#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace synthex
{

  /// Fixed set of workers that run one job each per round, with a barrier.
  ///
  /// run_all(job) hands job(worker_id) to every worker and returns once all of
  /// them are done. Symbol i is owned by worker i % size(), so a symbol is never
  /// touched by two workers in the same round.
  class WorkerPool final
  {
  public:
    explicit WorkerPool(std::size_t n_workers)
        : n_(n_workers ? n_workers : 1), jobs_(n_), has_job_(n_, false)
    {
      threads_.reserve(n_);
      for ( std::size_t i = 0; i < n_; ++i )
        threads_.emplace_back([this, i]() { loop_(i); });
    }

    ~WorkerPool()
    {
      {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
      }
      cv_.notify_all();
      for ( auto& t : threads_ ) {
        if ( t.joinable() )
          t.join();
      }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::size_t size() const noexcept { return n_; }

    // Blocks until job(wid) returned on every worker.
    void run_all(const std::function<void(std::size_t)>& job)
    {
      {
        std::lock_guard<std::mutex> lk(mu_);
        for ( std::size_t i = 0; i < n_; ++i ) {
          jobs_[i] = job;
          has_job_[i] = true;
        }
        done_ = 0;
      }
      cv_.notify_all();

      std::unique_lock<std::mutex> lk(mu_);
      cv_done_.wait(lk, [&]() { return done_ == n_; });
    }

  private:
    void loop_(std::size_t wid)
    {
      for ( ;; ) {
        std::function<void(std::size_t)> job;
        {
          std::unique_lock<std::mutex> lk(mu_);
          cv_.wait(lk, [&]() { return stop_ || has_job_[wid]; });
          if ( stop_ )
            return;
          job = std::move(jobs_[wid]);
          has_job_[wid] = false;
        }

        if ( job )
          job(wid);

        {
          std::lock_guard<std::mutex> lk(mu_);
          ++done_;
          if ( done_ == n_ )
            cv_done_.notify_one();
        }
      }
    }

    std::size_t n_;
    std::vector<std::thread> threads_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable cv_done_;
    bool stop_{false};
    std::vector<std::function<void(std::size_t)>> jobs_;
    std::vector<bool> has_job_;
    std::size_t done_{0};
  };

} // namespace synthex
