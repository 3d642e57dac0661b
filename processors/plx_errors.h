#ifndef PLX_ERRORS_H
#define PLX_ERRORS_H

#include "../utils/plx_string.h"
#include <exception>
#include <vector>

namespace plx::processors {

// ============================================================================
// ENGINE EXCEPTION HIERARCHY
// ============================================================================
//
// plx_exception (base)
// ├── plx_processor_error        processor rejected at load time
// ├── plx_missing_anchor_error   required anchor absent, aborts execution
// ├── plx_layout_error           layout could not be obtained
// ├── plx_expression_error       formula or predicate failed
// │   └── plx_missing_field_error
// └── plx_path_error             output path write rejected
//
// Only the first three ever leave plx_executor::execute. The others are
// caught per step and reported as warnings or validation failures.
//
// ============================================================================

class plx_exception : public std::exception {
protected:
  plx_string message_;
  plx_string context_;

public:
  explicit plx_exception(const plx_string& message)
    : message_(message), context_("") {}

  plx_exception(const plx_string& message, const plx_string& context)
    : message_(message), context_(context) {}

  virtual ~plx_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }

  plx_string get_message() const { return message_; }
  plx_string get_context() const { return context_; }
};

class plx_processor_error : public plx_exception {
private:
  std::vector<plx_string> problems_;

public:
  plx_processor_error(const plx_string& processor_name, const std::vector<plx_string>& problems)
    : plx_exception(plx_string("Processor '") + processor_name + "' is invalid: " +
                    plx_string("; ").join(problems), processor_name),
      problems_(problems) {}

  explicit plx_processor_error(const plx_string& message)
    : plx_exception(message) {}

  const std::vector<plx_string>& get_problems() const { return problems_; }
};

class plx_missing_anchor_error : public plx_exception {
private:
  plx_string anchor_name_;

public:
  explicit plx_missing_anchor_error(const plx_string& anchor_name)
    : plx_exception(plx_string("Required anchor '") + anchor_name + "' not found in document", anchor_name),
      anchor_name_(anchor_name) {}

  plx_string get_anchor_name() const { return anchor_name_; }
};

class plx_layout_error : public plx_exception {
public:
  using plx_exception::plx_exception;
};

class plx_expression_error : public plx_exception {
public:
  using plx_exception::plx_exception;
};

class plx_missing_field_error : public plx_expression_error {
private:
  plx_string field_;

public:
  explicit plx_missing_field_error(const plx_string& field)
    : plx_expression_error(plx_string("Missing field '") + field + "'", field),
      field_(field) {}

  plx_string get_field() const { return field_; }
};

class plx_path_error : public plx_exception {
public:
  plx_path_error(const plx_string& message, const plx_string& path)
    : plx_exception(message + " (path '" + path + "')", path) {}
};

} // namespace plx::processors

#endif // PLX_ERRORS_H
