# include "../../grammar/word-form.hpp"
# include <cstring>

namespace navimorph {
namespace grammar {

  static const std::vector<const char*> nounKeys = { "form", "case", "number" };
  static const std::vector<const char*> pronounKeys = { "form", "case", "person", "number", "animacy",
    "inclusivity", "gender", "honorific", "register", "kind" };
  static const std::vector<const char*> verbKeys = { "form", "pre-first", "first", "second", "voice",
    "transitivity", "compound" };
  static const std::vector<const char*> adjectiveKeys = { "form", "position", "le-derived", "comparison",
    "compared-to", "color" };
  static const std::vector<const char*> numberKeys = { "form", "value" };
  static const std::vector<const char*> particleKeys = { "type", "context" };
  static const std::vector<const char*> prenounKeys = { "type", "noun" };

  using WordList = std::vector<mtc::widestr>;

 /*
  * GetForm( features, forms )
  *
  * Returns the index of the 'form' feature value in the list of forms the
  * category can produce, 0 when 'form' is not set.
  */
  static  auto  GetForm( const FeatureSet& features, const std::vector<const char*>& forms ) -> size_t
  {
    if ( !features.Has( "form" ) )
      return 0;

    auto  sform = U8( features.GetString( "form" ) );

    for ( size_t i = 0; i != forms.size(); ++i )
      if ( sform == forms[i] )
        return i;

    throw UnknownCategoryOrFeature( mtc::strprintf( "unknown form '%s'", sform.c_str() ) );
  }

  static  auto  GetTraits( const FeatureSet& features ) -> PronounTraits
  {
    PronounTraits traits;

    traits.person = features.Get( "person", traits.person );
    traits.number = features.Get( "number", traits.number );
    traits.animacy = features.Get( "animacy", traits.animacy );
    traits.inclusivity = features.Get( "inclusivity", traits.inclusivity );
    traits.gender = features.Get( "gender", traits.gender );
    traits.honorific = features.GetBool( "honorific", traits.honorific );

    return traits;
  }

  struct Inflector
  {
    const mtc::zmap&  values;

    auto  operator()( const Noun& noun ) const -> WordList
    {
      auto  features = FeatureSet( values, nounKeys );

      switch ( GetForm( features, { "case", "indefinite" } ) )
      {
        case 0:
          return { noun.GetNumberWithCase(
            features.Get( "number", Number::singular ),
            features.Get( "case", Case::subjective ) ) };
        default:
          return { noun.MakeIndefinite() };
      }
    }

    auto  operator()( const Pronoun& pronoun ) const -> WordList
    {
      auto  features = FeatureSet( values, pronounKeys );
      auto& traits = pronoun.GetTraits();

      switch ( GetForm( features, { "case", "honorific", "gendered", "question", "short-plural", "short", "lahe", "basic" } ) )
      {
        case 0:
          if ( traits.honorific )
            return { Pronoun( pronoun.GetHonorificForm(), traits ).Decline( features.Get( "case", Case::subjective ) ) };
          return { pronoun.Decline( features.Get( "case", Case::subjective ) ) };
        case 1:
          return { pronoun.GetHonorificForm() };
        case 2:
          return { pronoun.GetGenderedForm() };
        case 3:
          {
            auto  forms = Pronoun::GetQuestionForms( traits.gender, traits.number );

            return { forms.first, forms.second };
          }
        case 4:
          return { pronoun.MakeShortPlural() };
        case 5:
          return { pronoun.GetShortForm() };
        case 6:
          return { Pronoun::GetLaheForm(
            features.Get( "register", Register::full ),
            features.Get( "case", Case::subjective ) ) };
        default:
          {
            auto  kind = features.Get( "kind", PronounKind::personal );

            if ( kind != PronounKind::personal )
              return { Pronoun::GetBasicForm( kind ) };

            return { Pronoun::GetBasicForm( traits.person, traits.number, traits.animacy, traits.inclusivity ) };
          }
      }
    }

    auto  operator()( const Verb& verb ) const -> WordList
    {
      auto  features = FeatureSet( values, verbKeys );

      switch ( GetForm( features, { "infix", "participle", "causative", "reflexive", "syllables" } ) )
      {
        case 0:
          return { verb.AddInfixes(
            features.GetString( "pre-first" ),
            features.GetString( "first" ),
            features.GetString( "second" ) ) };
        case 1:
          return { verb.MakeParticiple( features.Get( "voice", Voice::active ) ) };
        case 2:
          return { verb.MakeCausative() };
        case 3:
          return { verb.MakeReflexive() };
        default:
          return verb.GetSyllables();
      }
    }

    auto  operator()( const Adjective& adjective ) const -> WordList
    {
      auto  features = FeatureSet( values, adjectiveKeys );

      switch ( GetForm( features, { "attributive", "adverb", "comparative", "color-noun" } ) )
      {
        case 0:
          return { adjective.MakeAttributive( features.Get( "position", Position::before ) ) };
        case 1:
          return { adjective.MakeAdverb() };
        case 2:
          return { adjective.MakeComparative(
            features.Get( "comparison", Comparison::standard ),
            features.GetString( "compared-to" ) ) };
        default:
          return { adjective.MakeColorNoun() };
      }
    }

    auto  operator()( const Numeral& numeral ) const -> WordList
    {
      auto  features = FeatureSet( values, numberKeys );

      switch ( GetForm( features, { "cardinal", "ordinal", "fraction", "adverbial" } ) )
      {
        case 0:   return { numeral.GetCardinal() };
        case 1:   return { numeral.GetOrdinal() };
        case 2:   return { numeral.GetFraction() };
        default:  return { numeral.MakeAdverbial() };
      }
    }

    auto  operator()( const Particle& particle ) const -> WordList
    {
      auto  features = FeatureSet( values, particleKeys );

      return { particle.UseInContext( features.GetString( "context" ) ) };
    }

    auto  operator()( const Prenoun& prenoun ) const -> WordList
    {
      auto  features = FeatureSet( values, prenounKeys );

      return { prenoun.CombineWithNoun( features.GetString( "noun" ) ) };
    }

  };

  // WordForm implementation

  auto  WordForm::Create( Category category, const mtc::widestr& lemma, const mtc::zmap& values ) -> WordForm
  {
    switch ( category )
    {
      case Category::noun:
        return FeatureSet( values, nounKeys ), Variant( Noun( lemma ) );

      case Category::pronoun:
        return Variant( Pronoun( lemma, GetTraits( FeatureSet( values, pronounKeys ) ) ) );

      case Category::verb:
        {
          auto  features = FeatureSet( values, verbKeys );

          return Variant( Verb( lemma,
            features.Get( "transitivity", Transitivity::transitive ),
            features.GetBool( "compound", false ) ) );
        }

      case Category::adjective:
        {
          auto  features = FeatureSet( values, adjectiveKeys );
          auto  iscolor = features.Has( "form" ) && U8( features.GetString( "form" ) ) == "color-noun";

          return Variant( Adjective( lemma,
            features.GetBool( "le-derived", false ),
            features.GetBool( "color", iscolor ) ) );
        }

      case Category::number:
        return Variant( Numeral( lemma, FeatureSet( values, numberKeys ).GetUnsigned( "value", 0 ) ) );

      case Category::particle:
        return Variant( Particle( lemma, FeatureSet( values, particleKeys ).Get( "type", ParticleType::general ) ) );

      case Category::prenoun:
        return Variant( Prenoun( lemma, FeatureSet( values, prenounKeys ).Get( "type", PrenounType::deictic ) ) );

      default:
        throw UnknownCategoryOrFeature( mtc::strprintf( "unknown category %u", unsigned(category) ) );
    }
  }

  auto  WordForm::GetLemma() const -> const mtc::widestr&
  {
    return std::visit( []( const auto& word ) -> const mtc::widestr&
      {  return word.GetLemma();  }, value );
  }

  auto  WordForm::Inflect( const mtc::zmap& features ) const -> std::vector<mtc::widestr>
  {
    return std::visit( Inflector{ features }, value );
  }

}}
