#pragma once

#include <dnacq/base/fwd/system.process.h>

#include <dnacq/fwd/acquisition.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>

namespace dnacq
{
    StringLiteral to_string_literal(AcquisitionErrorKind kind) noexcept;

    struct AcquisitionError
    {
        AcquisitionErrorKind kind;
        LocalizedString message;
        // only set for InstallProcessError
        Optional<ExitCodeIntegral> exit_code;

        static AcquisitionError usage_error(LocalizedString message);
        static AcquisitionError install_process_error(ExitCodeIntegral exit_code, LocalizedString message);
        static AcquisitionError install_script_error(LocalizedString message);
        static AcquisitionError unexpected_error(LocalizedString message);

        std::string to_string() const;
        void to_string(std::string& target) const;

        friend bool operator==(const AcquisitionError& lhs, const AcquisitionError& rhs);
        friend bool operator!=(const AcquisitionError& lhs, const AcquisitionError& rhs) { return !(lhs == rhs); }
    };

    using AcquisitionResult = ExpectedT<Path, AcquisitionError>;
}

DNACQ_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(dnacq::AcquisitionErrorKind);
DNACQ_FORMAT_WITH_TO_STRING(dnacq::AcquisitionError);
