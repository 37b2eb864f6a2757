#pragma once
#include <moments_config.h>
#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace moments{

  /**
   * @brief A fixed-size pool of worker threads executing queued tasks
   *
   * Tasks still queued when the pool is destroyed are executed before the workers exit
   */
  class threadPool{
  public:
    /**
     * @brief Instantiate a pool of nt threads (at least 1)
     */
    explicit threadPool(const std::uint32_t nt): m_done(false){
      try{
	for(std::uint32_t i = 0; i < std::max(nt, 1u); i++)
	  m_threads.emplace_back(&threadPool::worker, this);
      }catch(...){
	shutdown();
	throw;
      }
    }

    threadPool(const threadPool &) = delete;
    threadPool & operator=(const threadPool &) = delete;

    ~threadPool(){ shutdown(); }

    /**
     * @brief Queue func(args...) for execution
     * @return A future holding the return value, or rethrowing the exception thrown by the task
     */
    template<typename Func, typename... Args>
    auto submit(Func &&func, Args&&... args){
      auto bound = std::bind(std::forward<Func>(func), std::forward<Args>(args)...);
      using result_type = std::result_of_t<decltype(bound)()>;

      //std::function requires a copyable target, so the move-only packaged_task is held by pointer
      auto task = std::make_shared<std::packaged_task<result_type()> >(std::move(bound));
      std::future<result_type> result = task->get_future();
      {
	std::lock_guard<std::mutex> _(m_mutex);
	m_tasks.emplace_back([task](){ (*task)(); });
      }
      m_cond.notify_one();
      return result;
    }

    size_t pool_size() const{ return m_threads.size(); }

  private:
    void worker(){
      while(true){
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(m_mutex);
	  m_cond.wait(lock, [this](){ return m_done || !m_tasks.empty(); });
	  if(m_tasks.empty()) return; //done and drained
	  task = std::move(m_tasks.front());
	  m_tasks.pop_front();
	}
	task();
      }
    }

    void shutdown(){
      {
	std::lock_guard<std::mutex> _(m_mutex);
	m_done = true;
      }
      m_cond.notify_all();
      for(auto &t : m_threads)
	if(t.joinable()) t.join();
    }

    bool m_done; /**< guarded by m_mutex */
    std::mutex m_mutex;
    std::condition_variable m_cond;
    std::deque<std::function<void()> > m_tasks;
    std::vector<std::thread> m_threads;
  };

}
