# include "../../grammar/verb.hpp"

namespace navimorph {
namespace grammar {

  auto  InsertInfix( const mtc::widestr& word, const mtc::widestr& infix, int index ) -> mtc::widestr
  {
    auto  syllables = Syllabify( word );
    auto  nsyllable = int(syllables.size());
    auto  ptarget = (mtc::widestr*)nullptr;
    auto  result = mtc::widestr();

    if ( nsyllable == 0 )
      return word;

    if ( index < 0 )  ptarget = &syllables[-index > nsyllable ? nsyllable - 1 : nsyllable + index];
      else  ptarget = &syllables[index >= nsyllable ? 0 : index];

    for ( size_t i = 0; i != ptarget->length(); ++i )
      if ( IsVowel( (*ptarget)[i] ) )
      {
        ptarget->insert( i, infix );
        break;
      }

    for ( auto& next: syllables )
      result += next;

    return result;
  }

  // Verb implementation

  Verb::Verb( const mtc::widestr& str, Transitivity tra, bool com ):
    lemma( str ),
    transitivity( tra ),
    compound( com ) {}

  auto  Verb::AddInfixes( const mtc::widestr& preFirst, const mtc::widestr& first, const mtc::widestr& second ) const -> mtc::widestr
  {
    auto  result = lemma;

    if ( !preFirst.empty() && Syllabify( lemma ).size() >= 2 )
      result = InsertInfix( result, preFirst, -2 );

    if ( !first.empty() )
      result = InsertInfix( result, first, -2 );

    if ( !second.empty() )
      result = InsertInfix( result, second, -1 );

    return result;
  }

  auto  Verb::MakeParticiple( Voice voice ) const -> mtc::widestr
  {
    return AddInfixes( {}, W( voice == Voice::active ? "us" : "awn" ), {} );
  }

  auto  Verb::MakeCausative() const -> mtc::widestr
  {
    return AddInfixes( W( "eyk" ), {}, {} );
  }

  auto  Verb::MakeReflexive() const -> mtc::widestr
  {
    return AddInfixes( W( "äp" ), {}, {} );
  }

  auto  Verb::GetSyllables() const -> std::vector<mtc::widestr>
  {
    return Syllabify( lemma );
  }

}}
