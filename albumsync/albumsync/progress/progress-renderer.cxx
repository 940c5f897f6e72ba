#include <albumsync/progress/progress-renderer.hxx>

#include <sstream>
#include <iomanip>

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <albumsync/progress/progress-tracker.hxx>

using namespace std;

namespace albumsync
{
  using namespace ftxui;

  template <typename S>
  Element progress_renderer_traits<S>::
  render_line (const string_type& lbl, const progress_snapshot& s)
  {
    using fmt = progress_tracker_traits<S>;

    double r (s.ratio ());

    // Item counter on the left so that the line still says something useful
    // when no sizes are known.
    //
    ostringstream l;
    l << '[' << setw (4) << s.current << '/' << s.total << "] " << lbl;

    ostringstream m;
    m << ' ' << setw (3) << static_cast<int> (r * 100) << "% "
      << s.stats.downloaded << " ok, "
      << s.stats.skipped << " skipped, "
      << s.stats.failed << " failed";

    ostringstream rt;
    rt << fmt::format_bytes (s.stats.transferred_bytes);

    if (uint64_t t = s.stats.total_bytes ())
      rt << " / " << fmt::format_bytes (t);

    rt << " | " << fmt::format_speed (s.speed)
       << " | ETA "
       << (s.eta_seconds ? fmt::format_duration (*s.eta_seconds)
                         : string ("unknown"));

    Element cnt (text (m.str ()));

    if (s.stats.failed != 0)
      cnt = cnt | color (Color::Red);

    return hbox ({
      text (l.str ()) | bold,
      text (" "),
      gauge (static_cast<float> (r)) | size (WIDTH, EQUAL, bar_width),
      cnt,
      filler (),
      text (" " + rt.str ())
    });
  }

  template <typename T>
  basic_progress_renderer<T>::
  basic_progress_renderer (ostream& o, bool e)
    : os_ (o), enabled_ (e)
  {
  }

  template <typename T>
  void basic_progress_renderer<T>::
  label (string_type l)
  {
    lock_guard<mutex> g (mutex_);
    label_ = move (l);
  }

  template <typename T>
  void basic_progress_renderer<T>::
  render (const progress_snapshot& s)
  {
    lock_guard<mutex> g (mutex_);

    if (!enabled_)
      return;

    Element e (traits_type::render_line (label_, s));

    // Full terminal width, but only as tall as the line is.
    //
    Screen sc (Screen::Create (Dimension::Full (), Dimension::Fit (e)));
    Render (sc, e);

    os_ << reset_ << sc.ToString () << flush;
    reset_ = sc.ResetPosition ();
    drawn_ = true;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    lock_guard<mutex> g (mutex_);

    if (drawn_)
      os_ << endl;

    drawn_ = false;
    reset_.clear ();
  }

  template <typename T>
  string basic_progress_renderer<T>::
  to_string (const string_type& l, const progress_snapshot& s, int w)
  {
    Element e (traits_type::render_line (l, s));

    Screen sc (Screen::Create (Dimension::Fixed (w), Dimension::Fixed (1)));
    Render (sc, e);

    return sc.ToString ();
  }

  template struct progress_renderer_traits<string>;
  template class basic_progress_renderer<progress_renderer_traits<>>;
}
