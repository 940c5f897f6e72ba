#include <cctype>
#include <algorithm>

namespace albumsync
{
  template <typename S>
  inline bool basic_http_headers<S>::
  same (const string_type& x, const string_type& y)
  {
    return x.size () == y.size () &&
           std::equal (x.begin (), x.end (), y.begin (),
                       [] (char a, char b)
                       {
                         return std::tolower (static_cast<unsigned char> (a)) ==
                                std::tolower (static_cast<unsigned char> (b));
                       });
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type name, string_type value)
  {
    remove (name);
    fields.push_back (field_type (std::move (name), std::move (value)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type name, string_type value)
  {
    fields.push_back (field_type (std::move (name), std::move (value)));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& name) const
  {
    for (const field_type& f: fields)
      if (same (f.name, name))
        return f.value;

    return std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& name)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&name] (const field_type& f)
                                  {
                                    return same (f.name, name);
                                  }),
                  fields.end ());
  }
}
