# include "load-file.hpp"
# include <moonycode/codes.h>
# include <mtc/exceptions.h>
# include <mtc/wcsstr.h>
# include <mtc/json.h>
# include <stdexcept>
# include <cstring>
# include <cstdio>
# include <cerrno>

namespace navimorph {
namespace lexicon {

  auto  ReadFile( const std::string& path ) -> std::string
  {
    auto  infile = fopen( path.c_str(), "rb" );
    auto  buffer = std::string();
    char  chunk[0x1000];
    size_t  cbread;

    if ( infile == nullptr )
    {
      throw mtc::FormatError<mtc::file_error>( "could not open file '%s', error %d (%s)",
        path.c_str(), errno, strerror( errno ) );
    }

    while ( (cbread = fread( chunk, 1, sizeof(chunk), infile )) != 0 )
      buffer.append( chunk, cbread );

    if ( ferror( infile ) )
    {
      fclose( infile );

      throw mtc::FormatError<mtc::file_error>( "error reading file '%s', error %d (%s)",
        path.c_str(), errno, strerror( errno ) );
    }

    return fclose( infile ), buffer;
  }

  auto  ParseJson( const std::string& source ) -> mtc::zval
  {
    auto  parsed = mtc::zval();

    if ( source.find_first_not_of( " \t\r\n" ) == std::string::npos )
      throw std::invalid_argument( "empty json document" );

    try
    {
      mtc::json::Parse( mtc::json::parse::make_source( source.c_str(), source.length() ), parsed );
    }
    catch ( const std::exception& x )
    {
      throw std::invalid_argument( mtc::strprintf( "invalid json document: %s", x.what() ) );
    }
    return parsed;
  }

  auto  GetWideStr( const mtc::zval& zv ) -> const mtc::widestr
  {
    if ( zv.get_type() == mtc::zval::z_charstr )
      return codepages::mbcstowide( codepages::codepage_utf8, *zv.get_charstr() );
    if ( zv.get_type() == mtc::zval::z_widestr )
      return *zv.get_widestr();
    throw std::invalid_argument( "value has to be string" );
  }

}}
