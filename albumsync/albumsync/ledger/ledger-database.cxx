#include <albumsync/ledger/ledger-database.hxx>

#include <ctime>
#include <iomanip>
#include <sstream>

#include <albumsync/ledger/ledger-types-odb.hxx>

using namespace std;

namespace albumsync
{
  string
  backup_timestamp (chrono::system_clock::time_point tp)
  {
    time_t t (chrono::system_clock::to_time_t (tp));

    tm l;
    localtime_r (&t, &l);

    ostringstream o;
    o << put_time (&l, "%Y%m%d-%H%M%S");
    return o.str ();
  }

  // Explicit template instantiation.
  //
  template class basic_ledger_database<ledger_database_traits<>>;
}
