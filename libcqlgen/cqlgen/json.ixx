// file      : cqlgen/json.ixx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  inline void
  to_json (const buffer& x, Json::Value& v)
  {
    static const char digits[] = "0123456789abcdef";

    std::string s;
    s.reserve (x.size () * 2);

    for (buffer::const_iterator i (x.begin ()); i != x.end (); ++i)
    {
      s += digits[*i >> 4];
      s += digits[*i & 0x0F];
    }

    v = s;
  }

  namespace details
  {
    inline int
    hex_digit (char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';

      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;

      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;

      return -1;
    }
  }

  inline void
  from_json (const Json::Value& v, buffer& x)
  {
    std::string s (v.asString ());

    if (s.size () % 2 != 0)
      throw Json::RuntimeError ("odd number of hex digits in blob value");

    x.clear ();
    x.reserve (s.size () / 2);

    for (std::string::size_type i (0); i < s.size (); i += 2)
    {
      int h (details::hex_digit (s[i])), l (details::hex_digit (s[i + 1]));

      if (h < 0 || l < 0)
        throw Json::RuntimeError ("invalid hex digit in blob value");

      x.push_back (static_cast<unsigned char> ((h << 4) | l));
    }
  }
}
