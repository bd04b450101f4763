# include "../trace.hpp"
# include <stdexcept>
# include <iterator>
# include <cstdio>
# include <ctime>

namespace navimorph {

  static const char* levelNames[] = { "DEBUG", "INFO", "WARNING", "ERROR" };

  auto  Trace::Stderr( Level minLevel ) -> Func
  {
    return [minLevel]( Level level, const std::string& message )
      {
        char      szdate[0x20];
        time_t    tmtime;
        struct tm tmlocal;

        if ( level < minLevel )
          return;

        time( &tmtime );
        localtime_r( &tmtime, &tmlocal );
        strftime( szdate, sizeof(szdate), "%Y-%m-%d %H:%M:%S", &tmlocal );

        fprintf( stderr, "[%s] %s: %s\n", szdate, ToString( level ), message.c_str() );
      };
  }

  auto  Trace::ToString( Level level ) -> const char*
  {
    return unsigned(level) < std::size(levelNames) ? levelNames[unsigned(level)] : "UNKNOWN";
  }

  auto  Trace::GetLevel( const std::string_view& name ) -> Level
  {
    if ( name == "debug" )    return Level::debug;
    if ( name == "info" )     return Level::info;
    if ( name == "warning" )  return Level::warning;
    if ( name == "error" )    return Level::error;

    throw std::invalid_argument( mtc::strprintf( "unknown log level '%s'",
      std::string( name ).c_str() ) );
  }

}
