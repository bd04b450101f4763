# include "../config.hpp"
# include "lexicon/load-file.hpp"
# include <moonycode/codes.h>
# include <mtc/wcsstr.h>
# include <stdexcept>
# include <cstring>

namespace navimorph {

  static  auto  GetString( const mtc::zval& z, const char* n ) -> std::string
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_charstr:
        return *z.get_charstr();
      case mtc::zval::z_widestr:
        return codepages::widetombcs( codepages::codepage_utf8, *z.get_widestr() );
      default:
        throw std::invalid_argument( mtc::strprintf( "field '%s' has to be string", n ) );
    }
  }

  static  void  GetLexicon( Config::Lexicon& lexicon, const mtc::zval& z )
  {
    if ( z.get_type() != mtc::zval::z_zmap )
      throw std::invalid_argument( "field 'lexicon' has to be structure" );

    for ( auto& next: *z.get_zmap() )
    {
      if ( !next.first.is_charstr() )
        throw std::invalid_argument( "field 'lexicon' may contain only string keys" );

      if ( strcmp( next.first.to_charstr(), "type" ) == 0 )  lexicon.type = GetString( next.second, "lexicon.type" );
        else
      if ( strcmp( next.first.to_charstr(), "path" ) == 0 )  lexicon.path = GetString( next.second, "lexicon.path" );
        else
      throw std::invalid_argument( mtc::strprintf( "unexpected field 'lexicon.%s'", next.first.to_charstr() ) );
    }

    if ( lexicon.type != "tsv" && lexicon.type != "json" )
      throw std::invalid_argument( mtc::strprintf( "unknown lexicon type '%s', 'tsv' or 'json' expected",
        lexicon.type.c_str() ) );
  }

  auto  LoadConfig( const mtc::zmap& cfg ) -> Config
  {
    auto  config = Config();

    for ( auto& next: cfg )
    {
      if ( !next.first.is_charstr() )
        throw std::invalid_argument( "config may contain only string keys" );

      if ( strcmp( next.first.to_charstr(), "exceptions" ) == 0 )  config.exceptions = GetString( next.second, "exceptions" );
        else
      if ( strcmp( next.first.to_charstr(), "lexicon" ) == 0 )     GetLexicon( config.lexicon, next.second );
        else
      if ( strcmp( next.first.to_charstr(), "output" ) == 0 )      config.output = GetString( next.second, "output" );
        else
      if ( strcmp( next.first.to_charstr(), "log-level" ) == 0 )   config.logLevel = Trace::GetLevel( GetString( next.second, "log-level" ) );
        else
      throw std::invalid_argument( mtc::strprintf( "unexpected config field '%s'", next.first.to_charstr() ) );
    }

    return config;
  }

  auto  LoadConfig( const std::string& path ) -> Config
  {
    auto  parsed = lexicon::ParseJson( lexicon::ReadFile( path ) );

    if ( parsed.get_type() != mtc::zval::z_zmap )
      throw std::invalid_argument( mtc::strprintf( "config '%s' has to be json object", path.c_str() ) );

    return LoadConfig( *parsed.get_zmap() );
  }

}
