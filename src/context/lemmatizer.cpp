# include "../../context/lemmatizer.hpp"
# include "../../grammar/phonology.hpp"
# include "../../compat.hpp"

namespace navimorph {
namespace context {

  Lemmatizer::Lemmatizer( const lexicon::ExceptionIndex& except, const lexicon::AffixTables& tables ):
    exceptions( except ),
    affixes( tables )
  {
    caseSuffixes = lexicon::ByLength( affixes.caseSuffixes );
    verbSuffixes = lexicon::ByLength( affixes.verbSuffixes );
  }

  Lemmatizer::Lemmatizer( const Lemmatizer& other ):
    Lemmatizer( other.exceptions, other.affixes ) {}

  auto  Lemmatizer::operator=( const Lemmatizer& other ) -> Lemmatizer&
  {
    exceptions = other.exceptions;
    affixes = other.affixes;
    caseSuffixes = lexicon::ByLength( affixes.caseSuffixes );
    verbSuffixes = lexicon::ByLength( affixes.verbSuffixes );
    return *this;
  }

  auto  Lemmatizer::Lemmatize( const widechar* pwsstr, size_t cchstr ) const -> mtc::widestr
  {
    if ( pwsstr == nullptr )
      throw InvalidInput( "Lemmatizer::Lemmatize( nullptr ) @" __FILE__ ":" LINE_STRING );

    return Lemmatize( mtc::widestr( pwsstr, cchstr ) );
  }

  auto  Lemmatizer::Lemmatize( const mtc::widestr& word ) const -> mtc::widestr
  {
    auto  normal = grammar::ToLower( word );
    auto  plemma = exceptions.Find( normal );

    if ( plemma != nullptr )
      return *plemma;

    normal = CutPrefix( normal );
    normal = CutSuffix( normal, caseSuffixes, true );
    normal = CutSuffix( normal, verbSuffixes, false );

    return normal;
  }

  auto  Lemmatizer::Lemmatize( const mtc::zval& word ) const -> mtc::widestr
  {
    switch ( word.get_type() )
    {
      case mtc::zval::z_widestr:
        return Lemmatize( *word.get_widestr() );
      case mtc::zval::z_charstr:
        return Lemmatize( codepages::mbcstowide( codepages::codepage_utf8, *word.get_charstr() ) );
      default:
        throw InvalidInput( "Lemmatizer::Lemmatize( zval ) expects string value @" __FILE__ ":" LINE_STRING );
    }
  }

  // number prefixes are scanned in table order
  auto  Lemmatizer::CutPrefix( const mtc::widestr& word ) const -> mtc::widestr
  {
    for ( auto& prefix: affixes.numberPrefixes )
      if ( word.length() > 2 * prefix.length() + 1 && grammar::StartsWith( word, prefix ) )
        return word.substr( prefix.length() );
    return word;
  }

 /*
  * Remaining stem has to be longer than affix length + 1 when guarded;
  * verb suffixes are stripped without the guard.
  */
  auto  Lemmatizer::CutSuffix( const mtc::widestr& word, const std::vector<const mtc::widestr*>& suffixes, bool guard ) const -> mtc::widestr
  {
    for ( auto suffix: suffixes )
      if ( (!guard || word.length() > 2 * suffix->length() + 1) && grammar::EndsWith( word, *suffix ) )
        return word.substr( 0, word.length() - suffix->length() );
    return word;
  }

}}
