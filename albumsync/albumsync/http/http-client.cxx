#include <albumsync/http/http-client.hxx>

namespace albumsync
{
  // Explicit template instantiation.
  //
  template struct http_client_traits<std::string>;
  template class basic_http_client<http_client_traits<std::string>>;
}
