# include "../../grammar/noun.hpp"
# include <mtc/test-it-easy.hpp>

using namespace navimorph;
using namespace navimorph::grammar;

TestItEasy::RegisterFunc  test_noun( []()
{
  TEST_CASE( "grammar/noun" )
  {
    SECTION( "case suffixes depend on the ending" )
    {
      SECTION( "* vowel-final noun" )
      {
        auto  tute = Noun( W( "tute" ) );

        REQUIRE( tute.GetCase( Case::subjective ) == W( "tute" ) );
        REQUIRE( tute.GetCase( Case::agentive ) == W( "tutel" ) );
        REQUIRE( tute.GetCase( Case::patientive ) == W( "tuteti" ) );
        REQUIRE( tute.GetCase( Case::dative ) == W( "tuteru" ) );
        REQUIRE( tute.GetCase( Case::genitive ) == W( "tuteyä" ) );
        REQUIRE( tute.GetCase( Case::topical ) == W( "tuteri" ) );
      }
      SECTION( "* consonant-final noun" )
      {
        auto  ikran = Noun( W( "ikran" ) );

        REQUIRE( ikran.GetCase( Case::agentive ) == W( "ikranil" ) );
        REQUIRE( ikran.GetCase( Case::patientive ) == W( "ikranit" ) );
        REQUIRE( ikran.GetCase( Case::dative ) == W( "ikranur" ) );
        REQUIRE( ikran.GetCase( Case::genitive ) == W( "ikranä" ) );
        REQUIRE( ikran.GetCase( Case::topical ) == W( "ikraniri" ) );
      }
      SECTION( "* diphthong-final noun takes vowel patientive and dative" )
      {
        auto  noun = Noun( W( "kelku'ay" ) );

        REQUIRE( noun.GetCase( Case::patientive ) == W( "kelku'ayti" ) );
        REQUIRE( noun.GetCase( Case::dative ) == W( "kelku'ayru" ) );
        REQUIRE( noun.GetCase( Case::agentive ) == W( "kelku'ayil" ) );
      }
      SECTION( "* genitive after o and u is plain ä" )
      {
        REQUIRE( Noun( W( "toruk" ) ).GetCase( Case::genitive ) == W( "torukä" ) );
        REQUIRE( Noun( W( "lo" ) ).GetCase( Case::genitive ) == W( "loä" ) );
        REQUIRE( Noun( W( "tsu" ) ).GetCase( Case::genitive ) == W( "tsuä" ) );
      }
      SECTION( "* explicit profile overrides the derived one" )
      {
        auto  noun = Noun( W( "ikran" ), Profile{ true, false, false } );

        REQUIRE( noun.GetCase( Case::agentive ) == W( "ikranl" ) );
      }
    }
    SECTION( "number prefixes lenite the stem" )
    {
      auto  tsmukan = Noun( W( "tsmukan" ) );

      REQUIRE( tsmukan.GetNumber( Number::singular ) == W( "tsmukan" ) );
      REQUIRE( tsmukan.GetNumber( Number::dual ) == W( "mesmukan" ) );
      REQUIRE( tsmukan.GetNumber( Number::trial ) == W( "pxesmukan" ) );
      REQUIRE( tsmukan.GetNumber( Number::plural ) == W( "aysmukan" ) );
      REQUIRE( Noun( W( "prrnen" ) ).GetNumber( Number::plural ) == W( "ayprrnen" ) );
      REQUIRE( Noun( W( "kxetse" ) ).GetNumber( Number::dual ) == W( "meketse" ) );
    }
    SECTION( "number with case derives the suffix from the numbered form" )
    {
      REQUIRE( Noun( W( "tsmukan" ) ).GetNumberWithCase( Number::plural, Case::agentive ) == W( "aysmukanil" ) );
      REQUIRE( Noun( W( "tute" ) ).GetNumberWithCase( Number::plural, Case::patientive ) == W( "aytuteti" ) );
      REQUIRE( Noun( W( "ikran" ) ).GetNumberWithCase( Number::dual, Case::subjective ) == W( "meikran" ) );
    }
    SECTION( "indefinite form appends o" )
    {
      REQUIRE( Noun( W( "tute" ) ).MakeIndefinite() == W( "tuteo" ) );
      REQUIRE( Noun( W( "ikran" ) ).MakeIndefinite() == W( "ikrano" ) );
    }
  }
} );
