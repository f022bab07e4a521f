#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "task_graph.hh"

enum class JobStatus : uint8_t
{
  Queued,
  Running,
  Finished,
  Failed,
};

std::ostream& operator<<( std::ostream& s, JobStatus status );

/**
 * Raised inside SequentialEngine when a task fails, to abort the rest of its job. It never escapes the engine: the
 * engine records it on the Job.
 */
class JobError : public std::runtime_error
{
  std::string task_id_;
  TaskFailure failure_;

public:
  JobError( const Task& task );

  const std::string& task_id() const { return task_id_; }
  const TaskFailure& failure() const { return failure_; }
};

/**
 * A named collection of Tasks, their dependency graph, and an aggregate status.
 */
class Job
{
  std::string job_id_;
  JobStatus status_ { JobStatus::Queued };
  TaskGraph tasks_ {};

  std::string error_message_ {};
  std::optional<std::string> failed_task_id_ {};

public:
  explicit Job( std::string job_id );

  Job( const Job& ) = delete;
  Job& operator=( const Job& ) = delete;

  const std::string& job_id() const { return job_id_; }
  JobStatus status() const { return status_; }

  TaskGraph& tasks() { return tasks_; }
  const TaskGraph& tasks() const { return tasks_; }

  const std::string& error_message() const { return error_message_; }
  const std::optional<std::string>& failed_task_id() const { return failed_task_id_; }

  bool terminal() const { return status_ == JobStatus::Finished or status_ == JobStatus::Failed; }

  /// Queued -> Running. Has no effect on a job that is already running.
  void start();

  /**
   * Recomputes the aggregate status. Once the graph is exhausted the job is Finished if every task finished and
   * Failed otherwise; before that the status is left alone.
   *
   * @return  Whether the job is now terminal.
   */
  bool update_status();

  /// Marks the job Failed because of @p error, recording the failing task.
  void abort( const JobError& error );

  friend std::ostream& operator<<( std::ostream& s, const Job& job );
};
