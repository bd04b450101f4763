# if !defined( __navimorph_grammar_noun_hpp__ )
# define __navimorph_grammar_noun_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

  // case suffix selected by the phonological profile of the stem
  auto  CaseSuffix( const mtc::widestr&, const Profile&, Case ) -> mtc::widestr;

  class Noun
  {
  public:
    Noun( const mtc::widestr& );
    Noun( const mtc::widestr&, const Profile& );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    auto  GetProfile() const -> const Profile&  {  return profile;  }

  public:
    auto  GetCase( Case ) const -> mtc::widestr;
    auto  GetNumber( Number ) const -> mtc::widestr;
    auto  GetNumberWithCase( Number, Case ) const -> mtc::widestr;
    auto  MakeIndefinite() const -> mtc::widestr;

  protected:
    mtc::widestr  lemma;
    Profile       profile;

  };

}}

# endif   // !__navimorph_grammar_noun_hpp__
