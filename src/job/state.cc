/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "job/state.hh"

using namespace std;

namespace xferd {

const char* to_string( const JobOperation op )
{
  switch ( op ) {
    case JobOperation::AddFile: return "add_file";
    case JobOperation::Start: return "start";
    case JobOperation::Suspend: return "suspend";
    case JobOperation::Resume: return "resume";
    case JobOperation::Cancel: return "cancel";
    case JobOperation::Complete: return "complete";
    case JobOperation::SetPriority: return "set_priority";
    case JobOperation::SetProxyUsage: return "set_proxy_usage";
    case JobOperation::SetCredentials: return "set_credentials";
    case JobOperation::Connected: return "connected";
    case JobOperation::Finished: return "finished";
    case JobOperation::TransientFailure: return "transient_failure";
    case JobOperation::Retry: return "retry";
    case JobOperation::FatalFailure: return "fatal_failure";
    case JobOperation::COUNT: break;
  }

  return "invalid";
}

optional<JobState> transition( const JobState from, const JobOperation op )
{
  using S = JobState;
  using O = JobOperation;

  if ( is_terminal( from ) ) {
    return nullopt;
  }

  if ( from == S::Unknown ) {
    return ( op == O::Cancel ) ? optional<JobState> { S::Cancelled } : nullopt;
  }

  switch ( op ) {
    case O::AddFile:
      if ( from == S::Queued ) return S::Queued;
      break;

    case O::Start:
      if ( from == S::Queued ) return S::Connecting;
      break;

    case O::Suspend:
      if ( from == S::Connecting or from == S::Transferring ) return S::Suspended;
      break;

    case O::Resume:
      if ( from == S::Suspended ) return S::Connecting;
      break;

    case O::Complete:
      if ( from == S::Transferred ) return S::Acknowledged;
      break;

    case O::Cancel:
      return S::Cancelled;

    case O::SetPriority:
    case O::SetProxyUsage:
    case O::SetCredentials:
      return from;

    case O::Connected:
      if ( from == S::Connecting ) return S::Transferring;
      break;

    case O::Finished:
      if ( from == S::Transferring ) return S::Transferred;
      break;

    case O::TransientFailure:
      if ( from == S::Transferring ) return S::TransientError;
      break;

    case O::Retry:
      if ( from == S::TransientError ) return S::Transferring;
      break;

    case O::FatalFailure:
      if ( from != S::Error ) return S::Error;
      break;

    case O::COUNT:
      break;
  }

  return nullopt;
}

} // namespace xferd
