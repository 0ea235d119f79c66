#ifndef OBJECTPOOL_H
#define OBJECTPOOL_H

#include <atomic>
#include <memory>

#include <boost/function.hpp>
#include <boost/lockfree/queue.hpp>
#include <boost/noncopyable.hpp>

#include "base/Logging.hpp"

namespace colrec {
namespace base {

// BoundedObjectPool keeps at most capacity() idle objects.
// acquire() never blocks: an empty pool hands out a freshly created object.
// Objects come back through the deleter of the returned handle; when the pool
// is already full (or gone) the object is destroyed instead.
// acquire() and the handle deleters may be called from any thread.
template <class T, class D = std::default_delete<T>>
class BoundedObjectPool : boost::noncopyable {
 private:
  struct ReturnToPool_Deleter {
    explicit ReturnToPool_Deleter(std::weak_ptr<BoundedObjectPool<T, D> *> pool)
        : pool_(pool) {}

    void operator()(T *ptr) {
      if (auto pool_ptr = pool_.lock())
        (*pool_ptr.get())->add(std::unique_ptr<T, D>{ptr});
      else
        D{}(ptr);
    }

   private:
    std::weak_ptr<BoundedObjectPool<T, D> *> pool_;
  };

  static T *default_factory() { return new T(); }

 public:
  typedef std::unique_ptr<T, ReturnToPool_Deleter> ptr_type;
  typedef boost::function<T *()> factory_type;

  explicit BoundedObjectPool(size_t capacity,
                             const factory_type &factory = &default_factory)
      : this_ptr_(new BoundedObjectPool<T, D> *(this)),
        factory_(factory),
        pool_(capacity),
        capacity_(capacity),
        size_(0) {}

  ~BoundedObjectPool() {
    // Outstanding handles see the expired weak_ptr and delete on release.
    this_ptr_.reset();
    T *ptr;
    while (pool_.pop(ptr)) D{}(ptr);
  }

  // Returns false if the pool was full and t has been destroyed.
  bool add(std::unique_ptr<T, D> t) {
    if (!t) return false;
    if (!pool_.bounded_push(t.get())) {
      LOG_DEBUG << "msg=\"object pool full, discard\" capacity=" << capacity_;
      return false;
    }
    t.release();
    size_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  ptr_type acquire() {
    T *ptr = nullptr;
    if (pool_.pop(ptr))
      size_.fetch_sub(1, std::memory_order_relaxed);
    else
      ptr = factory_();
    return ptr_type(ptr, ReturnToPool_Deleter{
                             std::weak_ptr<BoundedObjectPool<T, D> *>{this_ptr_}});
  }

  bool empty() const { return size() == 0; }

  // Number of idle objects, approximate under concurrent use.
  size_t size() const { return size_.load(std::memory_order_relaxed); }

  size_t capacity() const { return capacity_; }

 private:
  std::shared_ptr<BoundedObjectPool<T, D> *> this_ptr_;
  factory_type factory_;
  boost::lockfree::queue<T *> pool_;
  size_t capacity_;
  std::atomic<size_t> size_;
};

}  // namespace base
}  // namespace colrec

#endif
