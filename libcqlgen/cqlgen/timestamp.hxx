// file      : cqlgen/timestamp.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_TIMESTAMP_HXX
#define LIBCQLGEN_TIMESTAMP_HXX

#include <chrono>

namespace cqlgen
{
  // CQL timestamp: milliseconds since the UNIX epoch.
  //
  typedef std::chrono::system_clock::time_point timestamp;

  inline long long
  to_milliseconds (const timestamp& t)
  {
    return std::chrono::duration_cast<std::chrono::milliseconds> (
      t.time_since_epoch ()).count ();
  }

  inline timestamp
  from_milliseconds (long long ms)
  {
    return timestamp (
      std::chrono::duration_cast<timestamp::duration> (
        std::chrono::milliseconds (ms)));
  }
}

#endif // LIBCQLGEN_TIMESTAMP_HXX
