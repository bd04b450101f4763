# if !defined( __navimorph_grammar_word_form_hpp__ )
# define __navimorph_grammar_word_form_hpp__
# include "noun.hpp"
# include "pronoun.hpp"
# include "verb.hpp"
# include "adjective.hpp"
# include "numeral.hpp"
# include "particle.hpp"
# include "prenoun.hpp"
# include <variant>

namespace navimorph {
namespace grammar {

 /*
  * WordForm
  *
  * A lemma of one of the lexical categories with its intrinsic properties,
  * able to inflect itself given the feature map. Alternatives are kept in
  * the order of Category values.
  */
  class WordForm
  {
  public:
    using Variant = std::variant<Noun, Pronoun, Verb, Adjective, Numeral, Particle, Prenoun>;

  public:
    WordForm( Variant&& v ): value( std::move( v ) )  {}

  public:
    static  auto  Create( Category, const mtc::widestr&, const mtc::zmap& = {} ) -> WordForm;   // throws UnknownCategoryOrFeature

  public:
    auto  GetCategory() const -> Category  {  return Category( value.index() );  }
    auto  GetLemma() const -> const mtc::widestr&;
    auto  GetValue() const -> const Variant&  {  return value;  }

    auto  Inflect( const mtc::zmap& = {} ) const -> std::vector<mtc::widestr>;   // throws UnknownCategoryOrFeature

  protected:
    Variant value;

  };

}}

# endif   // !__navimorph_grammar_word_form_hpp__
