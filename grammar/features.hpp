# if !defined( __navimorph_grammar_features_hpp__ )
# define __navimorph_grammar_features_hpp__
# include "../exceptions.hpp"
# include <moonycode/codes.h>
# include <mtc/zmap.h>
# include <vector>
# include <string_view>

namespace navimorph {

  enum class Category: unsigned
  {
    noun = 0,
    pronoun = 1,
    verb = 2,
    adjective = 3,
    number = 4,
    particle = 5,
    prenoun = 6
  };

namespace grammar {

  enum class Case: unsigned
  {
    subjective = 0,
    agentive = 1,
    patientive = 2,
    dative = 3,
    genitive = 4,
    topical = 5
  };

  enum class Number: unsigned
  {
    singular = 0,
    dual = 1,
    trial = 2,
    plural = 3
  };

  enum class Person: unsigned   {  first = 0, second = 1, third = 2  };
  enum class Animacy: unsigned  {  animate = 0, inanimate = 1  };
  enum class Inclusivity: unsigned  {  exclusive = 0, inclusive = 1  };
  enum class Gender: unsigned   {  neutral = 0, male = 1, female = 2  };
  enum class Register: unsigned {  full = 0, shortened = 1  };

  enum class PronounKind: unsigned  {  personal = 0, reflexive = 1, indeterminate = 2  };

  enum class Voice: unsigned        {  active = 0, passive = 1  };
  enum class Transitivity: unsigned {  transitive = 0, intransitive = 1  };

  enum class Position: unsigned     {  before = 0, after = 1  };
  enum class Comparison: unsigned   {  standard = 0, superlative = 1, equality = 2  };

  enum class ParticleType: unsigned {  general = 0, question = 1, vocative = 2, negative = 3  };
  enum class PrenounType: unsigned  {  deictic = 0, question = 1, universal = 2  };

 /*
  * FromString<E>( name )
  *
  * Maps the feature value name to the enumeration value; throws
  * UnknownCategoryOrFeature for names outside of the enumeration.
  */
  template <class E>
  auto  FromString( const std::string_view& ) -> E;

  template <> auto  FromString<Category>( const std::string_view& ) -> Category;
  template <> auto  FromString<Case>( const std::string_view& ) -> Case;
  template <> auto  FromString<Number>( const std::string_view& ) -> Number;
  template <> auto  FromString<Person>( const std::string_view& ) -> Person;
  template <> auto  FromString<Animacy>( const std::string_view& ) -> Animacy;
  template <> auto  FromString<Inclusivity>( const std::string_view& ) -> Inclusivity;
  template <> auto  FromString<Gender>( const std::string_view& ) -> Gender;
  template <> auto  FromString<Register>( const std::string_view& ) -> Register;
  template <> auto  FromString<PronounKind>( const std::string_view& ) -> PronounKind;
  template <> auto  FromString<Voice>( const std::string_view& ) -> Voice;
  template <> auto  FromString<Transitivity>( const std::string_view& ) -> Transitivity;
  template <> auto  FromString<Position>( const std::string_view& ) -> Position;
  template <> auto  FromString<Comparison>( const std::string_view& ) -> Comparison;
  template <> auto  FromString<ParticleType>( const std::string_view& ) -> ParticleType;
  template <> auto  FromString<PrenounType>( const std::string_view& ) -> PrenounType;

  auto  ToString( Category ) -> const char*;
  auto  ToString( Case ) -> const char*;
  auto  ToString( Number ) -> const char*;
  auto  ToString( Person ) -> const char*;
  auto  ToString( Gender ) -> const char*;
  auto  ToString( Register ) -> const char*;

 /*
  * FeatureSet
  *
  * Typed read access to a feature map passed at the public boundary.
  * The map is validated against the list of keys allowed for a category.
  */
  class FeatureSet
  {
  public:
    FeatureSet( const mtc::zmap&, const std::vector<const char*>& );

  public:
    bool  Has( const char* ) const;

  template <class E>
    auto  Get( const char* key, E defval ) const -> E
    {
      auto  pval = values.get( key );

      return pval != nullptr ? FromString<E>( GetName( key, *pval ) ) : defval;
    }
    auto  GetString( const char* ) const -> mtc::widestr;
    auto  GetUnsigned( const char*, unsigned ) const -> unsigned;
    bool  GetBool( const char*, bool ) const;

  protected:
    static  auto  GetName( const char*, const mtc::zval& ) -> std::string;

  protected:
    const mtc::zmap&  values;

  };

}}

# endif   // !__navimorph_grammar_features_hpp__
