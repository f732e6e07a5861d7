// file      : cqlgen/nullable.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_NULLABLE_HXX
#define LIBCQLGEN_NULLABLE_HXX

#include <utility> // std::swap

namespace cqlgen
{
  template <typename T>
  class nullable
  {
  public:
    typedef T value_type;

    nullable ();
    nullable (const T&);
    nullable (const nullable&);

    nullable& operator= (const T&);
    nullable& operator= (const nullable&);

    void
    swap (nullable&);

    bool
    null () const;

    T&
    get ();

    const T&
    get () const;

    T*
    operator-> ();

    const T*
    operator-> () const;

    T&
    operator* ();

    const T&
    operator* () const;

    typedef void (nullable::*bool_convertible) ();
    operator bool_convertible () const
    {
      return null_ ? 0 : &nullable<T>::true_value;
    }

    void
    reset ();

  private:
    void true_value () {};

    T value_;
    bool null_;
  };

  template <typename T>
  inline bool
  operator== (const nullable<T>& x, const nullable<T>& y)
  {
    return x.null () == y.null () && (x.null () || *x == *y);
  }

  template <typename T>
  inline bool
  operator!= (const nullable<T>& x, const nullable<T>& y)
  {
    return !(x == y);
  }

  template <typename T>
  inline nullable<T>::
  nullable ()
      : value_ (), null_ (true)
  {
  }

  template <typename T>
  inline nullable<T>::
  nullable (const T& v)
      : value_ (v), null_ (false)
  {
  }

  template <typename T>
  inline nullable<T>::
  nullable (const nullable& y)
      : value_ (y.value_), null_ (y.null_)
  {
  }

  template <typename T>
  inline nullable<T>& nullable<T>::
  operator= (const T& v)
  {
    value_ = v;
    null_ = false;
    return *this;
  }

  template <typename T>
  inline nullable<T>& nullable<T>::
  operator= (const nullable& y)
  {
    if (this != &y)
    {
      value_ = y.value_;
      null_ = y.null_;
    }

    return *this;
  }

  template <typename T>
  inline void nullable<T>::
  swap (nullable& y)
  {
    std::swap (value_, y.value_);
    std::swap (null_, y.null_);
  }

  template <typename T>
  inline bool nullable<T>::
  null () const
  {
    return null_;
  }

  template <typename T>
  inline T& nullable<T>::
  get ()
  {
    return value_;
  }

  template <typename T>
  inline const T& nullable<T>::
  get () const
  {
    return value_;
  }

  template <typename T>
  inline T* nullable<T>::
  operator-> ()
  {
    return null_ ? 0 : &value_;
  }

  template <typename T>
  inline const T* nullable<T>::
  operator-> () const
  {
    return null_ ? 0 : &value_;
  }

  template <typename T>
  inline T& nullable<T>::
  operator* ()
  {
    return value_;
  }

  template <typename T>
  inline const T& nullable<T>::
  operator* () const
  {
    return value_;
  }

  template <typename T>
  inline void nullable<T>::
  reset ()
  {
    value_ = T ();
    null_ = true;
  }
}

#endif // LIBCQLGEN_NULLABLE_HXX
