namespace albumsync
{
  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    if (!headers.contains (string_type ("Host")))
    {
      url_parts p (parse_url (url));

      // The port is only part of Host if it is not the scheme's default.
      //
      string_type o (p.origin ());
      set_header (string_type ("Host"), o.substr (o.find ("://") + 3));
    }

    if (!headers.contains (string_type ("User-Agent")) && !ua.empty ())
      set_header (string_type ("User-Agent"), ua);
  }
}
