#ifndef PLX_LAZY_PTR_H
#define PLX_LAZY_PTR_H

#include <memory>
#include <stdexcept>

/*
 * Lazy pointer that either views an object owned elsewhere or owns one.
 * Non-const access creates an owned object on first use if nothing is set;
 * const access never creates and throws instead.
 * Copies share the same object.
 */

class plx_null_access_exception : public std::exception {
public:
    const char* what() const noexcept override {
        return "Access to null lazy pointer in const context";
    }
};

template <typename object_type>
class plx_lazy_ptr
{
  std::shared_ptr<object_type> owner;
  object_type* ptr;
public:
  plx_lazy_ptr() : ptr(nullptr) {}
  virtual ~plx_lazy_ptr() = default;

  plx_lazy_ptr(const plx_lazy_ptr& other) = default;
  plx_lazy_ptr& operator=(const plx_lazy_ptr& other) = default;

  void reset()
  {
    owner.reset();
    ptr = nullptr;
  }

  // managed=true hands ownership of p to this pointer (and its copies)
  void set(object_type* p, bool managed = false)
  {
    if (p == ptr)
    {
      return;
    }
    reset();
    if (managed)
    {
      owner.reset(p);
    }
    ptr = p;
  }

  // Non-const access - creates object if null
  virtual object_type& operator*()
  {
    if (ptr == nullptr)
    {
      owner = std::make_shared<object_type>();
      ptr = owner.get();
      on_create();
    }
    return *ptr;
  }

  // Const access - throws exception if null
  virtual const object_type& operator*() const
  {
    if (ptr == nullptr)
    {
      throw plx_null_access_exception();
    }
    return *ptr;
  }

  object_type* operator->()
  {
    return &*(*this);
  }

  const object_type* operator->() const
  {
    return &*(*this);
  }

  bool operator==(const plx_lazy_ptr& other) const
  {
    return ptr == other.ptr;
  }

  // Safe null check - doesn't throw, doesn't create
  bool is_null() const { return ptr == nullptr; }

  // nullptr if never accessed
  object_type* getptr() const { return ptr; }

  virtual void on_create() {}
};

#endif // PLX_LAZY_PTR_H
