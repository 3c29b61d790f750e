#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "platform.hpp"

namespace hue_log
{

// 线程安全的空闲链表对象池。
// T 需要可默认构造，并提供 Reset() 用于复用前清空状态。
// 池不记录实例身份：重复归还或归还后继续使用属于调用方错误。
template <typename T>
class ObjectPool
{
 public:
  class Releaser
  {
   public:
    Releaser() = default;
    explicit Releaser(ObjectPool* pool) : pool_(pool) {}

    void operator()(T* item) const noexcept
    {
      if (pool_)
      {
        pool_->Release(item);
      }
      else
      {
        delete item;
      }
    }

   private:
    ObjectPool* pool_ = nullptr;
  };

  using Handle = std::unique_ptr<T, Releaser>;

  // 空闲槽位一次预留，Release 在删除器中执行时不再分配内存
  explicit ObjectPool(size_t max_idle = HUE_LOG_POOL_MAX_IDLE) : max_idle_(max_idle)
  {
    idle_.reserve(max_idle_);
  }

  ObjectPool(const ObjectPool&) = delete;
  ObjectPool& operator=(const ObjectPool&) = delete;

  Handle Acquire()
  {
    std::unique_ptr<T> item;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!idle_.empty())
      {
        item = std::move(idle_.back());
        idle_.pop_back();
      }
    }

    if (item)
    {
      item->Reset();
      reuse_count_.fetch_add(1, std::memory_order_relaxed);
    }
    else
    {
      item = std::make_unique<T>();
      alloc_count_.fetch_add(1, std::memory_order_relaxed);
    }
    return Handle(item.release(), Releaser(this));
  }

  // 归还后调用方不得再访问 item
  void Release(T* item) noexcept
  {
    if (item == nullptr)
    {
      return;
    }
    std::unique_ptr<T> owned(item);
    release_count_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < max_idle_)
    {
      idle_.push_back(std::move(owned));
    }
  }

  // 销毁所有空闲实例并清零统计；已借出的句柄仍可正常归还
  void Clear()
  {
    std::vector<std::unique_ptr<T>> dropped;
    dropped.reserve(max_idle_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dropped.swap(idle_);
    }
    alloc_count_.store(0, std::memory_order_relaxed);
    reuse_count_.store(0, std::memory_order_relaxed);
    release_count_.store(0, std::memory_order_relaxed);
  }

  size_t IdleCount() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
  }

  size_t MaxIdle() const { return max_idle_; }

  size_t IdleCapacity() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.capacity();
  }

  uint64_t AllocCount() const { return alloc_count_.load(std::memory_order_relaxed); }
  uint64_t ReuseCount() const { return reuse_count_.load(std::memory_order_relaxed); }
  uint64_t ReleaseCount() const { return release_count_.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<T>> idle_;
  size_t max_idle_;

  std::atomic<uint64_t> alloc_count_{0};
  std::atomic<uint64_t> reuse_count_{0};
  std::atomic<uint64_t> release_count_{0};
};

}  // namespace hue_log
