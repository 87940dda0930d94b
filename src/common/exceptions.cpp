#include "evalbox/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace evalbox {
using namespace std;

evalbox_exception::evalbox_exception()
    : evalbox_exception("") {}

evalbox_exception::evalbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *evalbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const evalbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : evalbox_exception() {}

internal_error::internal_error(const string &message)
    : evalbox_exception(message) {}

invalid_input_error::invalid_input_error()
    : evalbox_exception() {}

invalid_input_error::invalid_input_error(const string &message)
    : evalbox_exception(message) {}

}  // namespace evalbox
