// file      : cqlgen/version.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_VERSION_HXX
#define CQLGEN_VERSION_HXX

// Version format is AABBCCDD: major, minor, bugfix, and alpha/beta
// (DD + 50) numbers.
//
#define CQLGEN_VERSION     1000000
#define CQLGEN_VERSION_STR "1.0.0"

#endif // CQLGEN_VERSION_HXX
