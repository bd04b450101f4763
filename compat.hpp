# if !defined( __navimorph_compat_hpp__ )
# define __navimorph_compat_hpp__

# if !defined( LINE_STRING )
#   define __LN_STRING( arg )  #arg
#   define _LN__STRING( arg )  __LN_STRING( arg )
#   define LINE_STRING _LN__STRING(__LINE__)
# endif   // !LINE_STRING

# if defined( _WIN32 ) || defined( _WIN64 )
#   include <io.h>
#   define access _access
#   define F_OK   0
# else
#   include <unistd.h>
# endif

# endif   // !__navimorph_compat_hpp__
