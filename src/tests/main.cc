#include <glog/logging.h>

#include "callback.hh"

void test( void );

int main( int argc, char* argv[] )
{
  if ( argc <= 0 ) {
    abort();
  }

  google::InitGoogleLogging( argv[0] );
  google::SetStderrLogging( google::INFO );
  google::InstallFailureSignalHandler();

  test();

  CallbackRegistry::get_instance().clear();
}
