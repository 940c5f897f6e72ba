namespace albumsync
{
  template <typename T>
  inline basic_progress_tracker<T>::
  basic_progress_tracker (sink_type s)
    : sink_ (std::move (s))
  {
  }

  template <typename T>
  inline void basic_progress_tracker<T>::
  sink (sink_type s)
  {
    std::lock_guard<std::mutex> l (mutex_);
    sink_ = std::move (s);
  }

  template <typename T>
  inline double basic_progress_tracker<T>::
  speed () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return mean ();
  }

  template <typename T>
  inline std::optional<progress_snapshot> basic_progress_tracker<T>::
  last () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return last_;
  }
}
