# include "../../grammar/prenoun.hpp"

namespace navimorph {
namespace grammar {

  Prenoun::Prenoun( const mtc::widestr& str, PrenounType pty ):
    lemma( str ),
    ptype( pty ) {}

  // vowel contraction: tsa- + atan -> tsatan
  auto  Prenoun::CombineWithNoun( const mtc::widestr& noun ) const -> mtc::widestr
  {
    if ( EndsWith( lemma, W( "a" ) ) && StartsWith( noun, W( "a" ) ) )
      return lemma.substr( 0, lemma.length() - 1 ) + noun;
    return lemma + noun;
  }

  bool  Prenoun::CausesLenition() const
  {
    static const std::vector<mtc::widestr> leniting = { W( "pe" ) };

    for ( auto& next: leniting )
      if ( StartsWith( lemma, next ) )
        return true;
    return false;
  }

}}
