# include "../../lexicon/exception-index.hpp"
# include "../../grammar/phonology.hpp"
# include "../toolbox/tmppath.h"
# include <mtc/test-it-easy.hpp>
# include <cstdio>

using namespace navimorph;
using namespace navimorph::lexicon;
using grammar::W;

class SourceMock: public IExceptionSource
{
  implement_lifetime_stub

  auto  Load() -> ExceptionIndex override
  {
    if ( broken )
      throw MalformedExceptionData( "broken source" );
    return ExceptionIndex().Add( W( "oe" ), { W( "oel" ) } );
  }

public:
  SourceMock( bool b ): broken( b ) {}

protected:
  bool  broken;
};

TestItEasy::RegisterFunc  test_exception_index( []()
{
  TEST_CASE( "lexicon/exception-index" )
  {
    auto  messages = std::vector<std::pair<Trace::Level, std::string>>();
    auto  traceFn = [&]( Trace::Level level, const std::string& msg )
      {  messages.emplace_back( level, msg );  };

    SECTION( "ExceptionIndex finds lemmas by forms" )
    {
      auto  except = ExceptionIndex()
        .Add( W( "Oe" ), { W( "oel" ), W( "OETI" ) } )
        .Add( W( "nga" ), { W( "ngal" ), W( "oel" ) } );

      REQUIRE( except.size() == 2 );

      SECTION( "* forms are compared in lower case" )
      {
        if ( REQUIRE( except.Find( W( "oeti" ) ) != nullptr ) )
          REQUIRE( *except.Find( W( "oeti" ) ) == W( "Oe" ) );
      }
      SECTION( "* lemma is one of its forms" )
      {
        if ( REQUIRE( except.Find( W( "nga" ) ) != nullptr ) )
          REQUIRE( *except.Find( W( "nga" ) ) == W( "nga" ) );
      }
      SECTION( "* the first entry added wins" )
      {
        if ( REQUIRE( except.Find( W( "oel" ) ) != nullptr ) )
          REQUIRE( *except.Find( W( "oel" ) ) == W( "Oe" ) );
      }
      SECTION( "* unknown words are not found" )
        {  REQUIRE( except.Find( W( "ikran" ) ) == nullptr );  }
    }
    SECTION( "LoadExceptions( zmap ) skips invalid entries" )
    {
      messages.clear();

      auto  except = LoadExceptions( mtc::zmap{
        { "ikran", std::vector<mtc::charstr>{ "ikranä", "ikranil" } },
        { "tute", 7 } }, traceFn );

      REQUIRE( except.size() == 1 );
      REQUIRE( except.Find( W( "ikranil" ) ) != nullptr );
      REQUIRE( except.Find( W( "tute" ) ) == nullptr );

      if ( REQUIRE( messages.size() == 1 ) )
        REQUIRE( messages[0].first == Trace::Level::warning );
    }
    SECTION( "LoadExceptions( source ) recovers from malformed data" )
    {
      messages.clear();

      auto  goodOne = SourceMock( false );
      auto  badOne = SourceMock( true );

      REQUIRE( LoadExceptions( &goodOne, traceFn ).size() == 1 );
      REQUIRE( messages.empty() );
      REQUIRE( LoadExceptions( &badOne, traceFn ).empty() );

      if ( REQUIRE( messages.size() == 1 ) )
        REQUIRE( messages[0].first == Trace::Level::warning );
    }
    SECTION( "OpenExceptions() reads json files" )
    {
      SECTION( "* valid file is loaded" )
      {
        auto  path = PutTmpFile( "navimorph-exceptions.json",
          "{ \"tute\": [ \"tutel\", \"tuteti\" ], \"po\": [ \"pol\" ] }" );
        auto  except = ExceptionIndex();

        REQUIRE_NOTHROW( except = OpenExceptions( path, traceFn )->Load() );
        REQUIRE( except.size() == 2 );

        if ( REQUIRE( except.Find( W( "tuteti" ) ) != nullptr ) )
          REQUIRE( *except.Find( W( "tuteti" ) ) == W( "tute" ) );

        remove( path.c_str() );
      }
      SECTION( "* missing file gives an empty index" )
      {
        messages.clear();

        auto  except = ExceptionIndex();

        REQUIRE_NOTHROW( except = OpenExceptions( GetTmpPath() + "navimorph-no-such-file.json", traceFn )->Load() );
        REQUIRE( except.empty() );

        if ( REQUIRE( messages.size() == 1 ) )
          REQUIRE( messages[0].first == Trace::Level::info );
      }
      SECTION( "* broken file throws MalformedExceptionData" )
      {
        auto  path = PutTmpFile( "navimorph-broken.json", "{ \"tute\": [ " );

        REQUIRE_EXCEPTION( OpenExceptions( path, traceFn )->Load(), MalformedExceptionData );
        REQUIRE( LoadExceptions( OpenExceptions( path, traceFn ).ptr(), traceFn ).empty() );

        remove( path.c_str() );
      }
      SECTION( "* empty file throws MalformedExceptionData" )
      {
        auto  path = PutTmpFile( "navimorph-empty.json", "" );

        REQUIRE_EXCEPTION( OpenExceptions( path, traceFn )->Load(), MalformedExceptionData );

        remove( path.c_str() );
      }
    }
  }
} );
