#include "process_runner.hh"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <glog/logging.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;

namespace {
/// Exit status of a child whose exec failed.
constexpr int exec_failed = 127;

/// Reads the errno a child reported before its exec failed. @return 0 if the exec succeeded.
int read_exec_error( int fd )
{
  int child_errno = 0;
  ssize_t n;
  do {
    n = read( fd, &child_errno, sizeof( child_errno ) );
  } while ( n < 0 and errno == EINTR );
  return n == sizeof( child_errno ) ? child_errno : 0;
}
}

any ProcessRunner::run()
{
  const auto* argv_strings = any_cast<vector<string>>( &task_.arguments() );
  if ( argv_strings == nullptr or argv_strings->empty() ) {
    throw ProcessError( task_.task_id() + ": arguments are not a command line" );
  }

  vector<char*> argv;
  argv.reserve( argv_strings->size() + 1 );
  for ( const auto& arg : *argv_strings ) {
    argv.push_back( const_cast<char*>( arg.c_str() ) );
  }
  argv.push_back( nullptr );

  VLOG( 1 ) << task_ << " executing " << argv_strings->front() << " with " << argv_strings->size() - 1
            << " arguments";

  // The write end closes on a successful exec, so the parent reads either an errno or EOF.
  int status_pipe[2];
  if ( pipe2( status_pipe, O_CLOEXEC ) < 0 ) {
    throw ProcessError( task_.task_id() + ": pipe failed: " + strerror( errno ) );
  }

  pid_t pid = fork();
  if ( pid < 0 ) {
    int fork_errno = errno;
    close( status_pipe[0] );
    close( status_pipe[1] );
    throw ProcessError( task_.task_id() + ": fork failed: " + strerror( fork_errno ) );
  }
  if ( pid == 0 ) {
    close( status_pipe[0] );
    execvp( argv[0], argv.data() );
    int exec_errno = errno;
    ssize_t ignored = write( status_pipe[1], &exec_errno, sizeof( exec_errno ) );
    (void)ignored;
    _exit( exec_failed );
  }

  close( status_pipe[1] );
  int exec_error = read_exec_error( status_pipe[0] );
  close( status_pipe[0] );

  int wstatus = 0;
  while ( waitpid( pid, &wstatus, 0 ) < 0 ) {
    if ( errno != EINTR ) {
      throw ProcessError( task_.task_id() + ": waitpid failed: " + strerror( errno ) );
    }
  }

  if ( WIFSIGNALED( wstatus ) ) {
    throw ProcessError( task_.task_id() + ": " + argv_strings->front() + " killed by signal "
                        + to_string( WTERMSIG( wstatus ) ) );
  }

  if ( exec_error != 0 ) {
    throw ProcessError( task_.task_id() + ": could not execute " + argv_strings->front() + ": "
                        + strerror( exec_error ) );
  }

  int code = WEXITSTATUS( wstatus );
  if ( code != 0 ) {
    throw ProcessError( task_.task_id() + ": " + argv_strings->front() + " exited with status "
                        + to_string( code ) );
  }
  return code;
}
