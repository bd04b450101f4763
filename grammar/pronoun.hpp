# if !defined( __navimorph_grammar_pronoun_hpp__ )
# define __navimorph_grammar_pronoun_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

  struct PronounTraits
  {
    Person      person = Person::third;
    Number      number = Number::singular;
    Animacy     animacy = Animacy::animate;
    Inclusivity inclusivity = Inclusivity::exclusive;
    Gender      gender = Gender::neutral;
    bool        honorific = false;
  };

  class Pronoun
  {
  public:
    Pronoun( const mtc::widestr&, const PronounTraits& = {} );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    auto  GetTraits() const -> const PronounTraits&  {  return traits;  }

    bool  IsAnimate() const   {  return traits.animacy == Animacy::animate;  }
    bool  IsInclusive() const {  return traits.inclusivity == Inclusivity::inclusive;  }

  public:
    auto  GetCase( Case ) const -> mtc::widestr;
    auto  GetGenitive() const -> mtc::widestr;
    auto  Decline( Case ) const -> mtc::widestr;

    auto  GetHonorificForm() const -> mtc::widestr;
    auto  GetGenderedForm() const -> mtc::widestr;
    auto  MakeShortPlural() const -> mtc::widestr;

    bool  HasShortForm() const;
    auto  GetShortForm() const -> mtc::widestr;

  public:
    static  auto  GetQuestionForms( Gender, Number ) -> std::pair<mtc::widestr, mtc::widestr>;
    static  auto  GetLaheForm( Register, Case ) -> mtc::widestr;
    static  auto  GetBasicForm( Person, Number, Animacy, Inclusivity ) -> mtc::widestr;
    static  auto  GetBasicForm( PronounKind ) -> mtc::widestr;

  protected:
    bool  IsThirdSingularAnimate() const;

  protected:
    mtc::widestr  lemma;
    PronounTraits traits;

  };

}}

# endif   // !__navimorph_grammar_pronoun_hpp__
