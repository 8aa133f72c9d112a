#include "clean/clean_policy.hpp"

namespace protfasta {

bool parse_invalid_sequence_action(const std::string& str,
                                   InvalidSequenceAction& out, Error& err) {
    if (str == "ignore") {
        out = InvalidSequenceAction::kIgnore;
    } else if (str == "fail") {
        out = InvalidSequenceAction::kFail;
    } else if (str == "remove") {
        out = InvalidSequenceAction::kRemove;
    } else if (str == "convert") {
        out = InvalidSequenceAction::kConvert;
    } else if (str == "convert-ignore") {
        out = InvalidSequenceAction::kConvertIgnore;
    } else if (str == "convert-remove") {
        out = InvalidSequenceAction::kConvertRemove;
    } else {
        err.set(ErrorKind::kInvalidPolicy,
                "invalid_sequence_action must be one of 'ignore', 'fail', "
                "'remove', 'convert', 'convert-ignore', 'convert-remove' "
                "(got '" + str + "')");
        return false;
    }
    return true;
}

bool parse_duplicate_action(const std::string& name, const std::string& str,
                            DuplicateAction& out, Error& err) {
    if (str == "ignore") {
        out = DuplicateAction::kIgnore;
    } else if (str == "fail") {
        out = DuplicateAction::kFail;
    } else if (str == "remove") {
        out = DuplicateAction::kRemove;
    } else {
        err.set(ErrorKind::kInvalidPolicy,
                name + " must be one of 'ignore', 'fail', 'remove' (got '" +
                str + "')");
        return false;
    }
    return true;
}

const char* action_name(InvalidSequenceAction action) {
    switch (action) {
        case InvalidSequenceAction::kIgnore:        return "ignore";
        case InvalidSequenceAction::kFail:          return "fail";
        case InvalidSequenceAction::kRemove:        return "remove";
        case InvalidSequenceAction::kConvert:       return "convert";
        case InvalidSequenceAction::kConvertIgnore: return "convert-ignore";
        case InvalidSequenceAction::kConvertRemove: return "convert-remove";
    }
    return "unknown";
}

const char* action_name(DuplicateAction action) {
    switch (action) {
        case DuplicateAction::kIgnore: return "ignore";
        case DuplicateAction::kFail:   return "fail";
        case DuplicateAction::kRemove: return "remove";
    }
    return "unknown";
}

bool validate_clean_inputs(const CleanPolicy& policy, bool expect_unique_header,
                           Error& err) {
    if (expect_unique_header &&
        policy.duplicate_record == DuplicateAction::kIgnore) {
        err.set(ErrorKind::kInvalidPolicy,
                "Cannot expect unique headers and ignore duplicate records");
        return false;
    }
    if (policy.correction_table && policy.correction_table->empty()) {
        err.set(ErrorKind::kInvalidPolicy,
                "If provided, the correction table must be non-empty");
        return false;
    }
    return true;
}

} // namespace protfasta
