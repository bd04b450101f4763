# if !defined( __navimorph_grammar_verb_hpp__ )
# define __navimorph_grammar_verb_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

 /*
  * InsertInfix( word, infix, index )
  *
  * Inserts the infix before the first vowel of the syllable selected by the
  * index; negative indices count from the end. An index out of range selects
  * the last syllable if negative and the first one otherwise.
  */
  auto  InsertInfix( const mtc::widestr&, const mtc::widestr&, int ) -> mtc::widestr;

  class Verb
  {
  public:
    Verb( const mtc::widestr&, Transitivity = Transitivity::transitive, bool compound = false );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    bool  IsTransitive() const  {  return transitivity == Transitivity::transitive;  }
    bool  IsCompound() const    {  return compound;  }

  public:
   /*
    * AddInfixes( preFirst, first, second )
    *
    * preFirst: eyk, äp (causative, reflexive);
    * first: iv, er, ol, us, awn (tense, aspect, mood, participles);
    * second: ei, äng, ats (affect, evidentiality).
    * Empty infix means the slot is not used.
    */
    auto  AddInfixes( const mtc::widestr& preFirst, const mtc::widestr& first, const mtc::widestr& second ) const -> mtc::widestr;

    auto  MakeParticiple( Voice = Voice::active ) const -> mtc::widestr;
    auto  MakeCausative() const -> mtc::widestr;
    auto  MakeReflexive() const -> mtc::widestr;
    auto  GetSyllables() const -> std::vector<mtc::widestr>;

  protected:
    mtc::widestr  lemma;
    Transitivity  transitivity;
    bool          compound;

  };

}}

# endif   // !__navimorph_grammar_verb_hpp__
