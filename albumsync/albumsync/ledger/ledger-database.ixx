#include <albumsync/albumsync-errors.hxx>

namespace albumsync
{
  template <typename T>
  inline bool basic_ledger_database<T>::
  is_open () const noexcept
  {
    return db_ != nullptr;
  }

  template <typename T>
  inline const fs::path& basic_ledger_database<T>::
  path () const noexcept
  {
    return path_;
  }

  template <typename T>
  inline fs::path basic_ledger_database<T>::
  backup_directory () const
  {
    return dir_ / traits_type::backup_dir;
  }

  template <typename T>
  inline typename basic_ledger_database<T>::database_type&
  basic_ledger_database<T>::
  db () const
  {
    if (db_ == nullptr)
      throw ledger_error ("ledger is closed", "access");

    return *db_;
  }
}
