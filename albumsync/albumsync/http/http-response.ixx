#include <charconv>

namespace albumsync
{
  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    auto cl (get_header (string_type ("Content-Length")));

    if (!cl)
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (cl->data (), cl->data () + cl->size (), n));

    if (r.ec == std::errc () && r.ptr == cl->data () + cl->size ())
      return n;

    return std::nullopt;
  }
}
