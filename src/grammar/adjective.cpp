# include "../../grammar/adjective.hpp"

namespace navimorph {
namespace grammar {

  Adjective::Adjective( const mtc::widestr& str, bool isLe, bool color ):
    lemma( str ),
    leDerived( isLe ),
    isColor( color ) {}

 /*
  * le-derived adjectives stay unmarked after the noun; 'a' is never doubled:
  * apxa tute, not apxaa tute
  */
  auto  Adjective::MakeAttributive( Position position ) const -> mtc::widestr
  {
    if ( leDerived && position == Position::after )
      return lemma;
    if ( EndsWith( lemma, W( "a" ) ) )
      return lemma;
    return lemma + W( "a" );
  }

  auto  Adjective::MakeAdverb() const -> mtc::widestr
  {
    return W( "ni" ) + lemma;
  }

  auto  Adjective::MakeComparative( Comparison comparison, const mtc::widestr& comparedTo ) const -> mtc::widestr
  {
    switch ( comparison )
    {
      case Comparison::standard:
        return comparedTo.empty() ? W( "to" ) : W( "to " ) + comparedTo;
      case Comparison::superlative:
        return W( "frato" );
      case Comparison::equality:
        return W( "niftxan " ) + lemma + W( " na" ) + (comparedTo.empty() ? comparedTo : W( " " ) + comparedTo);
      default:
        throw UnknownCategoryOrFeature( "unknown comparison value" );
    }
  }

  auto  Adjective::MakeColorNoun() const -> mtc::widestr
  {
    if ( !isColor )
      return lemma;

    // nasal assimilation: ean -> eampin
    if ( EndsWith( lemma, W( "n" ) ) )
      return lemma.substr( 0, lemma.length() - 1 ) + W( "mpin" );

    return lemma + W( "pin" );
  }

}}
