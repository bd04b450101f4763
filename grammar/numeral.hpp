# if !defined( __navimorph_grammar_numeral_hpp__ )
# define __navimorph_grammar_numeral_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

 /*
  * Numeral
  *
  * Octal numerals; the value is the number counted, 0 when unknown. Values
  * without a cardinal of their own use the word text as the cardinal.
  */
  class Numeral
  {
  public:
    Numeral( const mtc::widestr&, unsigned value = 0 );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    auto  GetValue() const -> unsigned  {  return value;  }

  public:
    auto  GetCardinal() const -> mtc::widestr;
    auto  GetOrdinal() const -> mtc::widestr;
    auto  GetFraction() const -> mtc::widestr;
    auto  MakeAdverbial() const -> mtc::widestr;

  protected:
    mtc::widestr  lemma;
    unsigned      value;

  };

}}

# endif   // !__navimorph_grammar_numeral_hpp__
