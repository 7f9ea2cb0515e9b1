#include <dnacq/base/checks.h>
#include <dnacq/base/strings.h>

#include <dnacq/acquisitionerror.h>

namespace dnacq
{
    StringLiteral to_string_literal(AcquisitionErrorKind kind) noexcept
    {
        switch (kind)
        {
            case AcquisitionErrorKind::UsageError: return "UsageError";
            case AcquisitionErrorKind::InstallProcessError: return "InstallProcessError";
            case AcquisitionErrorKind::InstallScriptError: return "InstallScriptError";
            case AcquisitionErrorKind::UnexpectedError: return "UnexpectedError";
            default: Checks::unreachable(DNACQ_LINE_INFO);
        }
    }

    AcquisitionError AcquisitionError::usage_error(LocalizedString message)
    {
        return AcquisitionError{AcquisitionErrorKind::UsageError, std::move(message), nullopt};
    }

    AcquisitionError AcquisitionError::install_process_error(ExitCodeIntegral exit_code, LocalizedString message)
    {
        return AcquisitionError{AcquisitionErrorKind::InstallProcessError, std::move(message), exit_code};
    }

    AcquisitionError AcquisitionError::install_script_error(LocalizedString message)
    {
        return AcquisitionError{AcquisitionErrorKind::InstallScriptError, std::move(message), nullopt};
    }

    AcquisitionError AcquisitionError::unexpected_error(LocalizedString message)
    {
        return AcquisitionError{AcquisitionErrorKind::UnexpectedError, std::move(message), nullopt};
    }

    std::string AcquisitionError::to_string() const
    {
        std::string result;
        to_string(result);
        return result;
    }

    void AcquisitionError::to_string(std::string& target) const
    {
        Strings::append(target, to_string_literal(kind), ": ", message.data());
        if (auto code = exit_code.get())
        {
            Strings::append(target, " (exit code ", *code, ')');
        }
    }

    bool operator==(const AcquisitionError& lhs, const AcquisitionError& rhs)
    {
        return lhs.kind == rhs.kind && lhs.message == rhs.message && lhs.exit_code == rhs.exit_code;
    }
}
