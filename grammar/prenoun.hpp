# if !defined( __navimorph_grammar_prenoun_hpp__ )
# define __navimorph_grammar_prenoun_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

  class Prenoun
  {
  public:
    Prenoun( const mtc::widestr&, PrenounType = PrenounType::deictic );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    auto  GetType() const -> PrenounType  {  return ptype;  }

  public:
    auto  CombineWithNoun( const mtc::widestr& ) const -> mtc::widestr;
    bool  CausesLenition() const;

  protected:
    mtc::widestr  lemma;
    PrenounType   ptype;

  };

}}

# endif   // !__navimorph_grammar_prenoun_hpp__
