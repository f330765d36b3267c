#include "agentgraph/core/error.hpp"

#include <boost/system/system_error.hpp>

#include <exception>

namespace agentgraph {

auto error_from_exception(std::exception_ptr eptr) -> TaskError {
  if (!eptr) {
    return TaskError{ErrorKind::Generic, "empty exception"};
  }
  try {
    std::rethrow_exception(eptr);
  } catch (const TaskException &e) {
    return e.error();
  } catch (const boost::system::system_error &e) {
    if (e.code() == boost::system::errc::timed_out) {
      return TaskError{ErrorKind::Timeout, e.what()};
    }
    return TaskError{ErrorKind::Generic, e.what()};
  } catch (const std::exception &e) {
    return TaskError{ErrorKind::Generic, e.what()};
  } catch (...) {
    return TaskError{ErrorKind::Generic, "unknown exception"};
  }
}

} // namespace agentgraph
