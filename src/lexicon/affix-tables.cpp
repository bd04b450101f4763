# include "../../lexicon/affix-tables.hpp"
# include <initializer_list>
# include <algorithm>

namespace navimorph {
namespace lexicon {

  static  auto  MakeSet( const std::initializer_list<const char*>& init ) -> AffixTables::AffixSet
  {
    AffixTables::AffixSet affset;

    for ( auto& next: init )
      affset.push_back( codepages::mbcstowide( codepages::codepage_utf8, next ) );

    return affset;
  }

  static  auto  MakeLenition( const std::initializer_list<std::pair<const char*, const char*>>& init ) -> AffixTables::Lenition
  {
    AffixTables::Lenition lenset;

    for ( auto& next: init )
    {
      lenset.emplace_back(
        codepages::mbcstowide( codepages::codepage_utf8, next.first ),
        codepages::mbcstowide( codepages::codepage_utf8, next.second ) );
    }

    return lenset;
  }

  auto  AffixTables::Default() -> const AffixTables&
  {
    static const AffixTables  tables = {
      MakeSet( { "ay", "me", "pxe" } ),
      MakeSet( { "l", "ìl", "ti", "it", "ru", "ìri", "yä", "ri", "ä" } ),
      MakeSet( { "ie", "i", "u", "ìm" } ),
    // clusters go before single letters so "px" is never read as "p"
      MakeLenition( {
        { "px", "p" },
        { "tx", "t" },
        { "kx", "k" },
        { "ts", "s" },
        { "p",  "p" },
        { "t",  "t" },
        { "k",  "k" } } ) };

    return tables;
  }

  auto  ByLength( const AffixTables::AffixSet& affset ) -> std::vector<const mtc::widestr*>
  {
    std::vector<const mtc::widestr*>  sorted;

    for ( auto& next: affset )
      sorted.push_back( &next );

    std::stable_sort( sorted.begin(), sorted.end(), []( const mtc::widestr* a, const mtc::widestr* b )
      {  return a->length() > b->length();  } );

    return sorted;
  }

}}
