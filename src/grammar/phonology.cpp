# include "../../grammar/phonology.hpp"
# include "../../lexicon/affix-tables.hpp"

namespace navimorph {
namespace grammar {

  static const widechar vowels[] = { 'a', 'e', 'i', 0x00ec, 'o', 'u', 0x00e4 };

  static  auto  Diphthongs() -> const std::vector<mtc::widestr>&
  {
    static const std::vector<mtc::widestr> diphthongs = { W( "aw" ), W( "ay" ), W( "ew" ), W( "ey" ) };

    return diphthongs;
  }

  static  auto  Pseudovowels() -> const std::vector<mtc::widestr>&
  {
    static const std::vector<mtc::widestr> pseudovowels = { W( "ll" ), W( "rr" ) };

    return pseudovowels;
  }

  auto  MakeWordMap( const std::initializer_list<std::pair<const char*, const char*>>& init ) -> WordMap
  {
    WordMap wordmap;

    for ( auto& next: init )
      wordmap.emplace( W( next.first ), W( next.second ) );

    return wordmap;
  }

  bool  IsVowel( widechar c ) noexcept
  {
    for ( auto v: vowels )
      if ( c == v )
        return true;
    return false;
  }

  bool  StartsWith( const mtc::widestr& str, const mtc::widestr& sub ) noexcept
  {
    return str.length() >= sub.length() && str.compare( 0, sub.length(), sub ) == 0;
  }

  bool  EndsWith( const mtc::widestr& str, const mtc::widestr& sub ) noexcept
  {
    return str.length() >= sub.length()
      && str.compare( str.length() - sub.length(), sub.length(), sub ) == 0;
  }

  bool  EndsWithVowel( const mtc::widestr& str ) noexcept
  {
    return !str.empty() && IsVowel( str.back() );
  }

  bool  EndsWithDiphthong( const mtc::widestr& str )
  {
    for ( auto& next: Diphthongs() )
      if ( EndsWith( str, next ) )
        return true;
    return false;
  }

  bool  EndsWithPseudovowel( const mtc::widestr& str )
  {
    for ( auto& next: Pseudovowels() )
      if ( EndsWith( str, next ) )
        return true;
    return false;
  }

  auto  GetProfile( const mtc::widestr& str ) -> Profile
  {
    return { EndsWithVowel( str ), EndsWithDiphthong( str ), EndsWithPseudovowel( str ) };
  }

  auto  ToLower( const mtc::widestr& str ) -> mtc::widestr
  {
    return codepages::strtolower( str );
  }

 /*
  * Lenite( word )
  *
  * Replaces the leading consonant cluster by the first matching entry of the
  * lenition table; a word with no matching onset is returned as is.
  */
  auto  Lenite( const mtc::widestr& word ) -> mtc::widestr
  {
    for ( auto& next: lexicon::AffixTables::Default().lenition )
      if ( StartsWith( word, next.first ) )
        return next.second + word.substr( next.first.length() );
    return word;
  }

 /*
  * Syllabify( word )
  *
  * Each syllable ends with its first vowel; the consonants after the last
  * vowel are attached to the last syllable. A word without vowels is one
  * syllable, an empty word has none.
  */
  auto  Syllabify( const mtc::widestr& word ) -> std::vector<mtc::widestr>
  {
    std::vector<mtc::widestr> syllables;
    mtc::widestr              current;

    for ( auto chnext: word )
    {
      current.push_back( chnext );

      if ( IsVowel( chnext ) )
      {
        syllables.push_back( std::move( current ) );
        current.clear();
      }
    }

    if ( !current.empty() )
    {
      if ( !syllables.empty() ) syllables.back() += current;
        else syllables.push_back( current );
    }

    return syllables;
  }

}}
