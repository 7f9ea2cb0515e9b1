DECLARE_MSG_ARG(actual, "")
DECLARE_MSG_ARG(command_line, "/bin/sh dotnet-install.sh -Version 3.1.0")
DECLARE_MSG_ARG(command_name, "acquire")
DECLARE_MSG_ARG(env_var, "DNACQ_INSTALL_ROOT")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(option, "install-root")
DECLARE_MSG_ARG(path, "/foo/bar")
DECLARE_MSG_ARG(system_api, "CreateProcessW")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(version, "3.1.0")
