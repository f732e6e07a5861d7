// file      : cqlgen/stream.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_STREAM_HXX
#define LIBCQLGEN_STREAM_HXX

#include <deque>
#include <mutex>
#include <cstddef> // std::size_t
#include <condition_variable>

namespace cqlgen
{
  // Bounded blocking queue with a single close. The producer blocks
  // while capacity entries are buffered. Once the stream is closed, the
  // consumer drains the remaining entries after which pop() returns
  // false.
  //
  template <typename T>
  class stream
  {
  public:
    typedef T value_type;

    // Capacity 0 is treated as 1.
    //
    explicit
    stream (std::size_t capacity);

    // Return false if the stream is closed, in which case the entry is
    // discarded.
    //
    bool
    push (const T&);

    bool
    pop (T&);

    void
    close ();

    bool
    closed () const;

    std::size_t
    size () const;

    std::size_t
    capacity () const
    {
      return capacity_;
    }

  private:
    stream (const stream&);
    stream& operator= (const stream&);

  private:
    std::size_t capacity_;
    bool closed_;
    std::deque<T> queue_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
  };
}

#include <cqlgen/stream.txx>

#endif // LIBCQLGEN_STREAM_HXX
