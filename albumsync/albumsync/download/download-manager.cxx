#include <albumsync/download/download-manager.hxx>

namespace albumsync
{
  // Explicit template instantiation.
  //
  template class basic_download_manager<ledger_database>;
}
