// file      : cqlgen/stream.txx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  template <typename T>
  stream<T>::
  stream (std::size_t capacity)
      : capacity_ (capacity != 0 ? capacity : 1), closed_ (false)
  {
  }

  template <typename T>
  bool stream<T>::
  push (const T& x)
  {
    std::unique_lock<std::mutex> l (mutex_);

    while (!closed_ && queue_.size () >= capacity_)
      not_full_.wait (l);

    if (closed_)
      return false;

    queue_.push_back (x);
    not_empty_.notify_one ();
    return true;
  }

  template <typename T>
  bool stream<T>::
  pop (T& x)
  {
    std::unique_lock<std::mutex> l (mutex_);

    while (!closed_ && queue_.empty ())
      not_empty_.wait (l);

    if (queue_.empty ())
      return false;

    x = queue_.front ();
    queue_.pop_front ();
    not_full_.notify_one ();
    return true;
  }

  template <typename T>
  void stream<T>::
  close ()
  {
    std::lock_guard<std::mutex> l (mutex_);
    closed_ = true;
    not_empty_.notify_all ();
    not_full_.notify_all ();
  }

  template <typename T>
  bool stream<T>::
  closed () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return closed_;
  }

  template <typename T>
  std::size_t stream<T>::
  size () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return queue_.size ();
  }
}
