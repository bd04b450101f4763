# include "../../grammar/pronoun.hpp"
# include "../../grammar/noun.hpp"
# include <iterator>

namespace navimorph {
namespace grammar {

  using FormPair = std::pair<const char*, const char*>;

  // who?, long and short forms by gender and number
  static const FormPair questionForms[3][4] =
  {
    { { "pesu",    "tupe" },     { "pemsu",    "mesupe" },    { "pepxsu",    "pxesupe" },    { "paysu",    "aysupe" } },
    { { "pestan",  "tutampe" },  { "pemstan",  "mestampe" },  { "pepxstan",  "pxestampe" },  { "paystan",  "aystampe" } },
    { { "peste",   "tutepe" },   { "pemste",   "mestepe" },   { "pepxste",   "pxestepe" },   { "payste",   "aystepe" } }
  };

  static const char* laheForms[2][6] =
  {
    { "aylahe", "aylahel", "aylaheti", "aylaheru", "aylaheyä", "aylaheri" },
    { "ayla",   "aylal",   "aylat",    "aylar",    "ayleyä",   "aylari" }
  };

  static const char* basicForms[][4] =
  {
    { "oe",     "moe",    "pxoe",     "ayoe" },       // 1st person exclusive
    { nullptr,  "oeng",   "pxoeng",   "ayoeng" },     // 1st person inclusive
    { "nga",    "menga",  "pxenga",   "aynga" },      // 2nd person
    { "po",     "mefo",   "pxefo",    "ayfo" },       // 3rd person animate
    { "tsa'u",  "mesa'u", "pxesa'u",  "aysa'u" }      // 3rd person inanimate
  };

  static  auto  Genitives() -> const WordMap&
  {
    static const WordMap  genitives = MakeWordMap( {
      { "fko",    "fkeyä" },
      { "nga",    "ngeyä" },
      { "po",     "peyä" },
      { "sno",    "sneyä" },
      { "tsa'u",  "tseyä" },
      { "ayla",   "ayleyä" },
      { "fo",     "feyä" },
      { "awnga",  "awngeyä" },
      { "ayoeng", "ayoengeyä" },
      { "oe",     "oeyä" },
      { "moe",    "moeyä" },
      { "pxoe",   "pxoeyä" },
      { "ayoe",   "ayoeyä" },
      { "oeng",   "oengeyä" },
      { "pxoeng", "pxoengeyä" } } );

    return genitives;
  }

  static  auto  Honorifics() -> const WordMap&
  {
    static const WordMap  honorifics = MakeWordMap( {
      { "oe",     "ohe" },
      { "moe",    "mohe" },
      { "pxoe",   "pxohe" },
      { "ayoe",   "ayohe" },
      { "oeng",   "oheng" },
      { "pxoeng", "pxoheng" },
      { "ayoeng", "ayoheng" },
      { "nga",    "ngenga" },
      { "menga",  "mengenga" },
      { "pxenga", "pxengenga" },
      { "aynga",  "ayngenga" },
      { "po",     "poho" } } );

    return honorifics;
  }

  static  auto  ShortForms() -> const WordMap&
  {
    static const WordMap  shortForms = MakeWordMap( {
      { "ayoeng", "awnga" },
      { "ayfo",   "fo" },
      { "aysa'u", "sa'u" } } );

    return shortForms;
  }

  // 'po'-derived pronouns: frapo, 'awpo, lapo, fìpo, tsapo
  static  bool  IsDerivedPo( const mtc::widestr& str )
  {
    static const std::vector<mtc::widestr> prefixes = { W( "fra" ), W( "'aw" ), W( "la" ), W( "fì" ), W( "tsa" ) };

    if ( !EndsWith( str, W( "po" ) ) )
      return false;

    for ( auto& next: prefixes )
      if ( StartsWith( str, next ) )
        return true;

    return false;
  }

  // Pronoun implementation

  Pronoun::Pronoun( const mtc::widestr& str, const PronounTraits& tra ):
    lemma( str ),
    traits( tra ) {}

  auto  Pronoun::GetCase( Case wcase ) const -> mtc::widestr
  {
    return Noun( lemma ).GetCase( wcase );
  }

  auto  Pronoun::GetGenitive() const -> mtc::widestr
  {
    if ( IsDerivedPo( lemma ) )
      return lemma.substr( 0, lemma.length() - 2 ) + W( "peyä" );

    auto  pfound = Genitives().find( lemma );

    return pfound != Genitives().end() ? pfound->second : lemma + W( "ä" );
  }

  auto  Pronoun::Decline( Case wcase ) const -> mtc::widestr
  {
    return wcase == Case::genitive ? GetGenitive() : GetCase( wcase );
  }

  auto  Pronoun::GetHonorificForm() const -> mtc::widestr
  {
    if ( IsThirdSingularAnimate() )
    {
      if ( traits.gender == Gender::male )
        return W( "pohan" );
      if ( traits.gender == Gender::female )
        return W( "pohe" );
    }

    auto  pfound = Honorifics().find( lemma );

    return pfound != Honorifics().end() ? pfound->second : lemma;
  }

  auto  Pronoun::GetGenderedForm() const -> mtc::widestr
  {
    if ( IsThirdSingularAnimate() )
    {
      if ( traits.gender == Gender::male )
        return W( "poan" );
      if ( traits.gender == Gender::female )
        return W( "poe" );
    }
    return lemma;
  }

  auto  Pronoun::MakeShortPlural() const -> mtc::widestr
  {
    if ( lemma == W( "po" ) || lemma == W( "fo" ) )
      return W( "ay" ) + Lenite( lemma );
    return W( "ay" ) + lemma;
  }

  bool  Pronoun::HasShortForm() const
  {
    return ShortForms().find( lemma ) != ShortForms().end();
  }

  auto  Pronoun::GetShortForm() const -> mtc::widestr
  {
    auto  pfound = ShortForms().find( lemma );

    return pfound != ShortForms().end() ? pfound->second : lemma;
  }

  auto  Pronoun::GetQuestionForms( Gender gender, Number number ) -> std::pair<mtc::widestr, mtc::widestr>
  {
    if ( unsigned(gender) >= std::size(questionForms) || unsigned(number) >= std::size(questionForms[0]) )
      throw UnknownCategoryOrFeature( "question pronoun gender or number out of range" );

    auto& forms = questionForms[unsigned(gender)][unsigned(number)];

    return { W( forms.first ), W( forms.second ) };
  }

  auto  Pronoun::GetLaheForm( Register regist, Case wcase ) -> mtc::widestr
  {
    if ( unsigned(regist) >= std::size(laheForms) || unsigned(wcase) >= std::size(laheForms[0]) )
      throw UnknownCategoryOrFeature( "'lahe' register or case out of range" );

    return W( laheForms[unsigned(regist)][unsigned(wcase)] );
  }

  auto  Pronoun::GetBasicForm( Person person, Number number, Animacy animacy, Inclusivity inclusivity ) -> mtc::widestr
  {
    const char* pszform;

    if ( unsigned(number) >= 4 )
      throw UnknownCategoryOrFeature( "pronoun number out of range" );

    switch ( person )
    {
      case Person::first:
        pszform = basicForms[inclusivity == Inclusivity::inclusive ? 1 : 0][unsigned(number)];
        break;
      case Person::second:
        pszform = basicForms[2][unsigned(number)];
        break;
      case Person::third:
        pszform = basicForms[animacy == Animacy::animate ? 3 : 4][unsigned(number)];
        break;
      default:
        throw UnknownCategoryOrFeature( "pronoun person out of range" );
    }

    if ( pszform == nullptr )
    {
      throw UnknownCategoryOrFeature( mtc::strprintf( "no %s person %s %s pronoun",
        ToString( person ), inclusivity == Inclusivity::inclusive ? "inclusive" : "exclusive",
        ToString( number ) ) );
    }

    return W( pszform );
  }

  auto  Pronoun::GetBasicForm( PronounKind kind ) -> mtc::widestr
  {
    switch ( kind )
    {
      case PronounKind::reflexive:      return W( "sno" );
      case PronounKind::indeterminate:  return W( "fko" );
      default:
        throw UnknownCategoryOrFeature( "personal pronouns need person and number" );
    }
  }

  bool  Pronoun::IsThirdSingularAnimate() const
  {
    return traits.person == Person::third
        && traits.number == Number::singular
        && traits.animacy == Animacy::animate;
  }

}}
