# include "../../grammar/numeral.hpp"

namespace navimorph {
namespace grammar {

  static const char* cardinals[] = { "'aw", "mune", "pxey", "tsing", "mrr", "pukap", "kinä", "vol" };

  static  auto  OrdinalStems() -> const WordMap&
  {
    static const WordMap  stems = MakeWordMap( {
      { "mune",   "mu" },
      { "tsing",  "tsi" },
      { "pukap",  "pu" },
      { "kinä",   "ki" } } );

    return stems;
  }

  Numeral::Numeral( const mtc::widestr& str, unsigned val ):
    lemma( str ),
    value( val )  {}

  auto  Numeral::GetCardinal() const -> mtc::widestr
  {
    return value >= 1 && value <= 8 ? W( cardinals[value - 1] ) : lemma;
  }

  auto  Numeral::GetOrdinal() const -> mtc::widestr
  {
    auto  cardinal = GetCardinal();
    auto  pfound = OrdinalStems().find( cardinal );

    return (pfound != OrdinalStems().end() ? pfound->second : cardinal) + W( "ve" );
  }

  auto  Numeral::GetFraction() const -> mtc::widestr
  {
    if ( value == 2 )
      return W( "mawl" );     // half
    if ( value == 3 )
      return W( "pan" );      // third

    auto  ordinal = GetOrdinal();

    return ordinal.substr( 0, ordinal.length() - 2 ) + W( "pxi" );
  }

  auto  Numeral::MakeAdverbial() const -> mtc::widestr
  {
    switch ( value )
    {
      case 1:   return W( "'awlo" );    // once
      case 2:   return W( "melo" );     // twice
      case 3:   return W( "pxelo" );    // three times
      default:  return W( "alo a" ) + GetCardinal();
    }
  }

}}
