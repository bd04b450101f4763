# include "../../grammar/noun.hpp"

namespace navimorph {
namespace grammar {

  auto  CaseSuffix( const mtc::widestr& stem, const Profile& profile, Case wcase ) -> mtc::widestr
  {
    switch ( wcase )
    {
      case Case::subjective:
        return {};
      case Case::agentive:
        return W( profile.endsWithVowel ? "l" : "il" );
      case Case::patientive:
        return W( profile.endsWithVowel || profile.endsWithDiphthong ? "ti" : "it" );
      case Case::dative:
        return W( profile.endsWithVowel || profile.endsWithDiphthong ? "ru" : "ur" );
      case Case::genitive:
        if ( profile.endsWithVowel )
          return W( EndsWith( stem, W( "o" ) ) || EndsWith( stem, W( "u" ) ) ? "ä" : "yä" );
        return W( "ä" );
      case Case::topical:
        return W( profile.endsWithVowel ? "ri" : "iri" );
      default:
        throw UnknownCategoryOrFeature( "unknown case value" );
    }
  }

  // Noun implementation

  Noun::Noun( const mtc::widestr& str ):
    lemma( str ),
    profile( grammar::GetProfile( str ) )  {}

  Noun::Noun( const mtc::widestr& str, const Profile& pro ):
    lemma( str ),
    profile( pro )  {}

  auto  Noun::GetCase( Case wcase ) const -> mtc::widestr
  {
    return lemma + CaseSuffix( lemma, profile, wcase );
  }

  auto  Noun::GetNumber( Number number ) const -> mtc::widestr
  {
    switch ( number )
    {
      case Number::singular:  return lemma;
      case Number::dual:      return W( "me" ) + Lenite( lemma );
      case Number::trial:     return W( "pxe" ) + Lenite( lemma );
      case Number::plural:    return W( "ay" ) + Lenite( lemma );
      default:
        throw UnknownCategoryOrFeature( "unknown number value" );
    }
  }

 /*
  * the case suffix is chosen by the ending of the numbered form, not by the
  * ending of the lemma
  */
  auto  Noun::GetNumberWithCase( Number number, Case wcase ) const -> mtc::widestr
  {
    return Noun( GetNumber( number ) ).GetCase( wcase );
  }

  auto  Noun::MakeIndefinite() const -> mtc::widestr
  {
    return lemma + W( "o" );
  }

}}
