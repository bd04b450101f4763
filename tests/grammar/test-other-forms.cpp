# include "../../grammar/adjective.hpp"
# include "../../grammar/numeral.hpp"
# include "../../grammar/particle.hpp"
# include "../../grammar/prenoun.hpp"
# include <mtc/test-it-easy.hpp>

using namespace navimorph;
using namespace navimorph::grammar;

TestItEasy::RegisterFunc  test_adjective( []()
{
  TEST_CASE( "grammar/adjective" )
  {
    SECTION( "attributive form" )
    {
      REQUIRE( Adjective( W( "lor" ) ).MakeAttributive() == W( "lora" ) );
      REQUIRE( Adjective( W( "apxa" ) ).MakeAttributive() == W( "apxa" ) );
      REQUIRE( Adjective( W( "lefpom" ), true ).MakeAttributive( Position::after ) == W( "lefpom" ) );
      REQUIRE( Adjective( W( "lefpom" ), true ).MakeAttributive( Position::before ) == W( "lefpoma" ) );
      REQUIRE( Adjective( W( "lor" ) ).MakeAttributive( Position::after ) == W( "lora" ) );
    }
    SECTION( "adverb prefixes 'ni'" )
      {  REQUIRE( Adjective( W( "lor" ) ).MakeAdverb() == W( "nilor" ) );  }
    SECTION( "comparative templates" )
    {
      auto  lor = Adjective( W( "lor" ) );

      REQUIRE( lor.MakeComparative( Comparison::standard, W( "ngal" ) ) == W( "to ngal" ) );
      REQUIRE( lor.MakeComparative( Comparison::standard ) == W( "to" ) );
      REQUIRE( lor.MakeComparative( Comparison::superlative, W( "ngal" ) ) == W( "frato" ) );
      REQUIRE( lor.MakeComparative( Comparison::equality, W( "ngal" ) ) == W( "niftxan lor na ngal" ) );
      REQUIRE( lor.MakeComparative( Comparison::equality ) == W( "niftxan lor na" ) );
    }
    SECTION( "color nouns" )
    {
      REQUIRE( Adjective( W( "ean" ), false, true ).MakeColorNoun() == W( "eampin" ) );
      REQUIRE( Adjective( W( "layla" ), false, true ).MakeColorNoun() == W( "laylapin" ) );
      REQUIRE( Adjective( W( "lor" ) ).MakeColorNoun() == W( "lor" ) );
    }
  }
} );

TestItEasy::RegisterFunc  test_numeral( []()
{
  TEST_CASE( "grammar/numeral" )
  {
    SECTION( "cardinals are looked up by value" )
    {
      REQUIRE( Numeral( W( "five" ), 5 ).GetCardinal() == W( "mrr" ) );
      REQUIRE( Numeral( W( "one" ), 1 ).GetCardinal() == W( "'aw" ) );
      REQUIRE( Numeral( W( "vosìng" ) ).GetCardinal() == W( "vosìng" ) );
      REQUIRE( Numeral( W( "mevol" ), 16 ).GetCardinal() == W( "mevol" ) );
    }
    SECTION( "ordinals use truncated stems for 2, 4, 6 and 7" )
    {
      REQUIRE( Numeral( {}, 2 ).GetOrdinal() == W( "muve" ) );
      REQUIRE( Numeral( {}, 4 ).GetOrdinal() == W( "tsive" ) );
      REQUIRE( Numeral( {}, 6 ).GetOrdinal() == W( "puve" ) );
      REQUIRE( Numeral( {}, 7 ).GetOrdinal() == W( "kive" ) );
      REQUIRE( Numeral( {}, 3 ).GetOrdinal() == W( "pxeyve" ) );
      REQUIRE( Numeral( {}, 5 ).GetOrdinal() == W( "mrrve" ) );
    }
    SECTION( "fractions" )
    {
      REQUIRE( Numeral( {}, 2 ).GetFraction() == W( "mawl" ) );
      REQUIRE( Numeral( {}, 3 ).GetFraction() == W( "pan" ) );
      REQUIRE( Numeral( {}, 4 ).GetFraction() == W( "tsipxi" ) );
      REQUIRE( Numeral( {}, 5 ).GetFraction() == W( "mrrpxi" ) );
    }
    SECTION( "adverbials" )
    {
      REQUIRE( Numeral( {}, 1 ).MakeAdverbial() == W( "'awlo" ) );
      REQUIRE( Numeral( {}, 2 ).MakeAdverbial() == W( "melo" ) );
      REQUIRE( Numeral( {}, 3 ).MakeAdverbial() == W( "pxelo" ) );
      REQUIRE( Numeral( {}, 4 ).MakeAdverbial() == W( "alo atsing" ) );
    }
  }
} );

TestItEasy::RegisterFunc  test_particle( []()
{
  TEST_CASE( "grammar/particle" )
  {
    REQUIRE( Particle( W( "srak" ), ParticleType::question ).UseInContext( W( "nga kame" ) ) == W( "srak nga kame" ) );
    REQUIRE( Particle( W( "ma" ), ParticleType::vocative ).UseInContext( W( "Eytukan" ) ) == W( "ma Eytukan" ) );
    REQUIRE( Particle( W( "kea" ), ParticleType::negative ).UseInContext( W( "oe kame" ) ) == W( "oe kame kea" ) );
    REQUIRE( Particle( W( "nìtam" ) ).UseInContext( W( "oe kame" ) ) == W( "oe kame nìtam" ) );
    REQUIRE( Particle( W( "srak" ), ParticleType::question ).IsQuestion() );
    REQUIRE( Particle( W( "ma" ), ParticleType::vocative ).IsVocative() );
    REQUIRE( !Particle( W( "nìtam" ) ).IsQuestion() );
  }
} );

TestItEasy::RegisterFunc  test_prenoun( []()
{
  TEST_CASE( "grammar/prenoun" )
  {
    REQUIRE( Prenoun( W( "tsa" ) ).CombineWithNoun( W( "atan" ) ) == W( "tsatan" ) );
    REQUIRE( Prenoun( W( "fì" ) ).CombineWithNoun( W( "tsyìp" ) ) == W( "fìtsyìp" ) );
    REQUIRE( Prenoun( W( "pe" ), PrenounType::question ).CombineWithNoun( W( "tute" ) ) == W( "petute" ) );
    REQUIRE( Prenoun( W( "pe" ), PrenounType::question ).CausesLenition() );
    REQUIRE( !Prenoun( W( "tsa" ) ).CausesLenition() );
  }
} );
