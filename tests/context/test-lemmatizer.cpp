# include "../../context/lemmatizer.hpp"
# include "../../grammar/phonology.hpp"
# include <mtc/test-it-easy.hpp>

using namespace navimorph;
using grammar::W;

TestItEasy::RegisterFunc  test_lemmatizer( []()
{
  TEST_CASE( "context/lemmatizer" )
  {
    auto  lemmatizer = context::Lemmatizer( lexicon::ExceptionIndex()
      .Add( W( "oe" ), { W( "oel" ), W( "oeti" ) } )
      .Add( W( "tsmukan" ), { W( "aysmukan" ) } ) );

    SECTION( "number prefixes are stripped" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "pxetsmukan" ) ) == W( "tsmukan" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "meikran" ) ) == W( "ikran" ) );
    }
    SECTION( "case suffixes are stripped, longest first" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "tìyawnä" ) ) == W( "tìyawn" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "tutetìri" ) ) == W( "tutet" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "ikranit" ) ) == W( "ikran" ) );
    }
    SECTION( "verb suffixes are stripped" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "kameie" ) ) == W( "kame" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "taronìm" ) ) == W( "taron" ) );
    }
    SECTION( "input is lower-cased" )
      {  REQUIRE( lemmatizer.Lemmatize( W( "PxeTsmukan" ) ) == W( "tsmukan" ) );  }
    SECTION( "exceptions take precedence over the rules" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "oel" ) ) == W( "oe" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "OETI" ) ) == W( "oe" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "aysmukan" ) ) == W( "tsmukan" ) );
      REQUIRE( context::Lemmatizer().Lemmatize( W( "aysmukan" ) ) == W( "smukan" ) );
    }
    SECTION( "affixes are not stripped from short words" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "ayo" ) ) == W( "ayo" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "mepo" ) ) == W( "mepo" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "tul" ) ) == W( "tul" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "kìl" ) ) == W( "kìl" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "ayä" ) ) == W( "ayä" ) );
      SECTION( "* verb suffixes have no such limit" )
        {  REQUIRE( lemmatizer.Lemmatize( W( "lie" ) ) == W( "l" ) );  }
    }
    SECTION( "each stage is applied once" )
    {
      REQUIRE( lemmatizer.Lemmatize( W( "ayaykame" ) ) == W( "aykame" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "mesmukanäl" ) ) == W( "smukanä" ) );
    }
    SECTION( "lemmatization is idempotent on stems" )
    {
      for ( auto word: { "pxetsmukan", "tìyawnä", "kameie", "ikranit" } )
      {
        auto  lemma = lemmatizer.Lemmatize( W( word ) );

        REQUIRE( lemmatizer.Lemmatize( lemma ) == lemma );
      }
    }
    SECTION( "empty string is valid input" )
      {  REQUIRE( lemmatizer.Lemmatize( mtc::widestr() ) == mtc::widestr() );  }
    SECTION( "non-text input throws InvalidInput" )
    {
      REQUIRE_EXCEPTION( lemmatizer.Lemmatize( (const widechar*)nullptr, 0 ), InvalidInput );
      REQUIRE_EXCEPTION( lemmatizer.Lemmatize( mtc::zval( 12 ) ), InvalidInput );
      REQUIRE_EXCEPTION( lemmatizer.Lemmatize( mtc::zval() ), InvalidInput );
      REQUIRE( lemmatizer.Lemmatize( mtc::zval( mtc::charstr( "kameie" ) ) ) == W( "kame" ) );
    }
    SECTION( "copies keep working affix tables" )
    {
      auto  copied = context::Lemmatizer( lemmatizer );

      lemmatizer = context::Lemmatizer();

      REQUIRE( copied.Lemmatize( W( "oel" ) ) == W( "oe" ) );
      REQUIRE( copied.Lemmatize( W( "tìyawnä" ) ) == W( "tìyawn" ) );
      REQUIRE( lemmatizer.Lemmatize( W( "oel" ) ) == W( "oel" ) );
    }
  }
} );
