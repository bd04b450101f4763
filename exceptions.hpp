# if !defined( __navimorph_exceptions_hpp__ )
# define __navimorph_exceptions_hpp__
# include <stdexcept>

namespace navimorph {

 /*
  * InvalidInput
  *
  * Lemmatizer was given something that is not a text value.
  */
  class InvalidInput: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

 /*
  * UnknownCategoryOrFeature
  *
  * Generator was called with a category, feature key or feature value
  * outside of the closed enumerations, or with a combination that has
  * no surface form.
  */
  class UnknownCategoryOrFeature: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

 /*
  * MalformedExceptionData
  *
  * Exception table source could not be parsed at all.
  */
  class MalformedExceptionData: public std::runtime_error {  using std::runtime_error::runtime_error;  };

}

# endif   // !__navimorph_exceptions_hpp__
