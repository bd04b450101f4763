# if !defined( __navimorph_lexicon_exception_index_hpp__ )
# define __navimorph_lexicon_exception_index_hpp__
# include "../exceptions.hpp"
# include "../trace.hpp"
# include <moonycode/codes.h>
# include <mtc/interfaces.h>
# include <mtc/zmap.h>
# include <vector>
# include <set>

namespace navimorph {
namespace lexicon {

 /*
  * ExceptionIndex
  *
  * Irregular surface forms by lemma. Forms are compared in lower case, and
  * the lemma itself always counts as one of its forms. Entries are scanned
  * in the order they were added.
  */
  class ExceptionIndex
  {
  public:
    struct Entry
    {
      mtc::widestr            lemma;
      mtc::widestr            lower;
      std::set<mtc::widestr>  forms;
    };

  public:
    auto  Add( const mtc::widestr&, const std::vector<mtc::widestr>& ) -> ExceptionIndex&;
    auto  Find( const mtc::widestr& ) const -> const mtc::widestr*;

    auto  begin() const -> std::vector<Entry>::const_iterator {  return entries.begin();  }
    auto  end() const -> std::vector<Entry>::const_iterator   {  return entries.end();  }
    auto  size() const -> size_t  {  return entries.size();  }
    bool  empty() const {  return entries.empty();  }

  protected:
    std::vector<Entry>  entries;

  };

  struct IExceptionSource: mtc::Iface
  {
    virtual auto  Load() -> ExceptionIndex = 0;   // throws MalformedExceptionData
  };

 /*
  * LoadExceptions( zmap, trace )
  *
  * Builds the index from a parsed { lemma: [form, ...] } table. Entries
  * with non-string keys or non-string forms are skipped with a warning.
  */
  auto  LoadExceptions( const mtc::zmap&, const Trace::Func& = nullptr ) -> ExceptionIndex;

 /*
  * LoadExceptions( source, trace )
  *
  * Loads the index from the source; a source that fails with
  * MalformedExceptionData gives an empty index and a warning.
  */
  auto  LoadExceptions( IExceptionSource*, const Trace::Func& = nullptr ) -> ExceptionIndex;

  // json file source; missing file gives an empty index
  auto  OpenExceptions( const std::string&, const Trace::Func& = nullptr ) -> mtc::api<IExceptionSource>;

}}

# endif   // !__navimorph_lexicon_exception_index_hpp__
