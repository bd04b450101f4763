# if !defined( __navimorph_grammar_adjective_hpp__ )
# define __navimorph_grammar_adjective_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

  class Adjective
  {
  public:
    Adjective( const mtc::widestr&, bool leDerived = false, bool isColor = false );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    bool  IsLeDerived() const {  return leDerived;  }
    bool  IsColor() const     {  return isColor;  }

  public:
    auto  MakeAttributive( Position = Position::before ) const -> mtc::widestr;
    auto  MakeAdverb() const -> mtc::widestr;
    auto  MakeComparative( Comparison = Comparison::standard, const mtc::widestr& comparedTo = {} ) const -> mtc::widestr;
    auto  MakeColorNoun() const -> mtc::widestr;

  protected:
    mtc::widestr  lemma;
    bool          leDerived;
    bool          isColor;

  };

}}

# endif   // !__navimorph_grammar_adjective_hpp__
