# include "../../lexicon/lexicon.hpp"
# include "load-file.hpp"
# include <mtc/wcsstr.h>
# include <stdexcept>
# include <algorithm>
# include <map>

namespace navimorph {
namespace lexicon {

  class MemLexicon final: public ILexicon
  {
    implement_lifetime_control

  public:
    MemLexicon( std::vector<LexRecord>&& );

  public:
    auto  Lookup( const mtc::widestr& ) const -> const LexRecord* override;
    auto  GetCount() const -> size_t override  {  return records.size();  }

  protected:
    std::vector<LexRecord>          records;
    std::map<mtc::widestr, size_t>  indexed;

  };

  // MemLexicon implementation

  MemLexicon::MemLexicon( std::vector<LexRecord>&& list ):
    records( std::move( list ) )
  {
    // the first record with the key wins
    for ( size_t i = 0; i != records.size(); ++i )
      indexed.emplace( codepages::strtolower( records[i].surfaceForm ), i );
  }

  auto  MemLexicon::Lookup( const mtc::widestr& lemma ) const -> const LexRecord*
  {
    auto  pfound = indexed.find( codepages::strtolower( lemma ) );

    return pfound != indexed.end() ? &records[pfound->second] : nullptr;
  }

  // json records

  static  auto  GetString( const mtc::zmap& record, const char* key, const char* defval ) -> mtc::widestr
  {
    auto  pval = record.get( key );

    if ( pval == nullptr )
      return codepages::mbcstowide( codepages::codepage_utf8, defval );

    try
    {
      return GetWideStr( *pval );
    }
    catch ( const std::invalid_argument& )
    {
      throw std::invalid_argument( mtc::strprintf( "field '%s' has to be string", key ) );
    }
  }

  static  auto  GetStrings( const mtc::zmap& record, const char* key ) -> std::vector<mtc::widestr>
  {
    auto  pval = record.get( key );
    auto  alist = std::vector<mtc::widestr>();

    if ( pval == nullptr )
      return alist;

    switch ( pval->get_type() )
    {
      case mtc::zval::z_array_charstr:
        for ( auto& next: *pval->get_array_charstr() )
          alist.push_back( codepages::mbcstowide( codepages::codepage_utf8, next ) );
        return alist;
      case mtc::zval::z_array_widestr:
        return *pval->get_array_widestr();
      case mtc::zval::z_array_zval:
        for ( auto& next: *pval->get_array_zval() )
          if ( next.get_type() == mtc::zval::z_charstr || next.get_type() == mtc::zval::z_widestr )
            alist.push_back( GetWideStr( next ) );
          else throw std::invalid_argument( mtc::strprintf( "field '%s' has to be array of strings", key ) );
        return alist;
      default:
        throw std::invalid_argument( mtc::strprintf( "field '%s' has to be array of strings", key ) );
    }
  }

  static  auto  GetRecord( const mtc::zmap& record ) -> LexRecord
  {
    auto  pnavi = record.get( "navi" );

    if ( pnavi == nullptr )
      throw std::invalid_argument( "record has to have 'navi' string field" );

    return {
      GetString( record, "navi", "" ),
      GetString( record, "syllabic", "" ),
      GetString( record, "acoustic", "" ),
      GetString( record, record.get( "wordclass" ) != nullptr ? "wordclass" : "pos", "unknown" ),
      GetStrings( record, "translations" ) };
  }

  auto  CreateLexicon( std::vector<LexRecord>&& records ) -> mtc::api<ILexicon>
  {
    return new MemLexicon( std::move( records ) );
  }

  auto  LoadLexicon( const mtc::zval& list, const Trace::Func& trace ) -> mtc::api<ILexicon>
  {
    std::vector<LexRecord>  records;
    size_t                  nindex = 0;

    auto  AddRecord = [&]( const mtc::zmap& record )
      {
        try
        {
          records.push_back( GetRecord( record ) );
        }
        catch ( const std::invalid_argument& x )
        {
          Report( trace, Trace::Level::warning, "dictionary record %u skipped: %s",
            unsigned(nindex), x.what() );
        }
        ++nindex;
      };

    switch ( list.get_type() )
    {
      case mtc::zval::z_array_zmap:
        for ( auto& next: *list.get_array_zmap() )
          AddRecord( next );
        break;
      case mtc::zval::z_array_zval:
        for ( auto& next: *list.get_array_zval() )
        {
          if ( next.get_type() == mtc::zval::z_zmap )
            AddRecord( *next.get_zmap() );
          else Report( trace, Trace::Level::warning, "dictionary record %u skipped: not a structure", unsigned(nindex++) );
        }
        break;
      default:
        throw std::invalid_argument( "dictionary has to be array of records" );
    }

    return CreateLexicon( std::move( records ) );
  }

  auto  LoadJsonLexicon( const std::string& path, const Trace::Func& trace ) -> mtc::api<ILexicon>
  {
    auto  lexicon = LoadLexicon( ParseJson( ReadFile( path ) ), trace );

    return Report( trace, Trace::Level::info, "dictionary '%s': %u records",
      path.c_str(), unsigned(lexicon->GetCount()) ), lexicon;
  }

  // tab-separated records

  static  auto  Strip( const std::string& str ) -> std::string
  {
    auto  ntop = str.find_first_not_of( " \t\r\n" );
    auto  nend = str.find_last_not_of( " \t\r\n" );

    return ntop != std::string::npos ? str.substr( ntop, nend - ntop + 1 ) : std::string();
  }

  static  auto  SplitLine( const std::string& line ) -> std::vector<std::string>
  {
    std::vector<std::string>  fields;
    size_t                    ntop = 0;

    for ( auto npos = line.find( '\t' ); npos != std::string::npos; npos = line.find( '\t', ntop = npos + 1 ) )
      fields.push_back( line.substr( ntop, npos - ntop ) );

    return fields.push_back( line.substr( ntop ) ), fields;
  }

  auto  LoadTsvLexicon( const std::string& path, const Trace::Func& trace ) -> mtc::api<ILexicon>
  {
    auto  source = ReadFile( path );
    auto  header = std::vector<std::string>();
    auto  colmap = std::map<std::string, size_t>();
    auto  record = std::vector<LexRecord>();
    auto  nlines = size_t(0);
    auto  ntexts = size_t(0);

    for ( size_t ntop = 0, nend; ntop < source.length(); ntop = nend + 1, ++nlines )
    {
      auto  string = std::string();
      auto  fields = std::vector<std::string>();

      if ( (nend = source.find( '\n', ntop )) == std::string::npos )
        nend = source.length();

      if ( Strip( string = source.substr( ntop, nend - ntop ) ).empty() )
        continue;

      fields = SplitLine( string );

    // first non-empty line names the columns
      if ( ntexts++ == 0 )
      {
        for ( size_t i = 0; i != fields.size(); ++i )
          colmap.emplace( Strip( fields[i] ), i );

        for ( auto colname: { "Word (Na'vi)", "POS", "Translation (en)" } )
          if ( colmap.find( colname ) == colmap.end() )
          {
            Report( trace, Trace::Level::warning, "'%s' is missing expected column '%s'",
              path.c_str(), colname );
            return CreateLexicon( {} );
          }
        continue;
      }

      auto  nnavi = colmap["Word (Na'vi)"];
      auto  npos = colmap["POS"];
      auto  ntran = colmap["Translation (en)"];

      if ( fields.size() <= std::max( nnavi, std::max( npos, ntran ) ) )
      {
        Report( trace, Trace::Level::warning, "'%s', line %u: not enough fields, skipped",
          path.c_str(), unsigned(nlines + 1) );
        continue;
      }

      record.push_back( {
        codepages::strtolower( codepages::mbcstowide( codepages::codepage_utf8, Strip( fields[nnavi] ) ) ),
        {},
        {},
        codepages::mbcstowide( codepages::codepage_utf8, Strip( fields[npos] ) ),
        { codepages::mbcstowide( codepages::codepage_utf8, Strip( fields[ntran] ) ) } } );
    }

    Report( trace, Trace::Level::info, "dictionary '%s': %u records",
      path.c_str(), unsigned(record.size()) );

    return CreateLexicon( std::move( record ) );
  }

}}
