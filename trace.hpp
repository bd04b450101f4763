# if !defined( __navimorph_trace_hpp__ )
# define __navimorph_trace_hpp__
# include <mtc/wcsstr.h>
# include <string_view>
# include <functional>
# include <string>

namespace navimorph {

  struct Trace final
  {
    enum class Level: unsigned
    {
      debug = 0,
      info = 1,
      warning = 2,
      error = 3
    };

    using Func = std::function<void(Level, const std::string&)>;

    static  auto  Stderr( Level = Level::info ) -> Func;
    static  auto  ToString( Level ) -> const char*;
    static  auto  GetLevel( const std::string_view& ) -> Level;   // throws invalid_argument

  };

  template <class... Args>
  void  Report( const Trace::Func& trace, Trace::Level level, const char* format, Args... args )
  {
    if ( trace != nullptr )
      trace( level, mtc::strprintf( format, args... ) );
  }

}

# endif   // !__navimorph_trace_hpp__
