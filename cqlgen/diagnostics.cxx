// file      : cqlgen/diagnostics.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cqlgen/diagnostics.hxx>

using namespace std;

static ostream&
location (cutl::fs::path const& p, size_t line, size_t clmn)
{
  cerr << p;

  if (line != 0)
  {
    cerr << ':' << line;

    if (clmn != 0)
      cerr << ':' << clmn;
  }

  return cerr;
}

std::ostream&
error (cutl::fs::path const& p, size_t line, size_t clmn)
{
  return location (p, line, clmn) << ": error: ";
}

std::ostream&
warn (cutl::fs::path const& p, size_t line, size_t clmn)
{
  return location (p, line, clmn) << ": warning: ";
}

std::ostream&
info (cutl::fs::path const& p, size_t line, size_t clmn)
{
  return location (p, line, clmn) << ": info: ";
}

std::ostream&
error (cutl::fs::path const& p)
{
  return error (p, 0, 0);
}

std::ostream&
warn (cutl::fs::path const& p)
{
  return warn (p, 0, 0);
}

std::ostream&
info (cutl::fs::path const& p)
{
  return info (p, 0, 0);
}

std::ostream&
error ()
{
  cerr << "cqlgen: error: ";
  return cerr;
}

std::ostream&
warn ()
{
  cerr << "cqlgen: warning: ";
  return cerr;
}

std::ostream&
info ()
{
  cerr << "cqlgen: info: ";
  return cerr;
}
