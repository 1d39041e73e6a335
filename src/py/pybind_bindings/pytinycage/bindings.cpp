/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>

#include "src/main/tools/tinycage-api.h"

namespace py = pybind11;
using namespace tinycage;

static void Check(int res) {
  if (res < 0) {
    throw std::runtime_error(TinyCageGetErrorMsg());
  }
}

PYBIND11_MODULE(pytinycage, m) {
    m.doc() = "Python bindings for libtinycage";

    py::class_<Exception>(m, "Exception")
        .def_static("read", &Exception::Read, py::arg("path"), "Allow reading a path")
        .def_static("write", &Exception::Write, py::arg("path"), "Allow reading and writing a path")
        .def_static("execute", &Exception::Execute, py::arg("path"), "Allow executing a path")
        .def_static("networking", &Exception::Networking, "Allow network access")
        .def_static("custom_environment", &Exception::CustomEnvironment, py::arg("env"),
                    "Replace the environment of the child")
        .def("__repr__", &Exception::ToString);

    py::enum_<Stdio>(m, "Stdio")
        .value("INHERIT", Stdio::Inherit)
        .value("NULL", Stdio::Null)
        .value("PIPED", Stdio::Piped);

    py::class_<Command>(m, "Command")
        .def(py::init<const std::string&>(), py::arg("program"))
        .def("arg0", &Command::Arg0, py::arg("name"), py::return_value_policy::reference_internal)
        .def("arg", &Command::Arg, py::arg("arg"), py::return_value_policy::reference_internal)
        .def("args", &Command::Args, py::arg("args"), py::return_value_policy::reference_internal)
        .def("current_dir", &Command::CurrentDir, py::arg("dir"),
             py::return_value_policy::reference_internal)
        .def("stdin", &Command::Stdin, py::arg("mode"), py::return_value_policy::reference_internal)
        .def("stdout", &Command::Stdout, py::arg("mode"), py::return_value_policy::reference_internal)
        .def("stderr", &Command::Stderr, py::arg("mode"), py::return_value_policy::reference_internal);

    py::class_<ExitStatus>(m, "ExitStatus")
        .def_readonly("exited", &ExitStatus::exited)
        .def_readonly("code", &ExitStatus::code)
        .def_readonly("signal", &ExitStatus::signal)
        .def("success", &ExitStatus::success)
        .def("__repr__", &ExitStatus::ToString);

    py::class_<Output>(m, "Output")
        .def_readonly("status", &Output::status)
        .def_property_readonly("stdout", [](const Output& o) { return py::bytes(o.stdout_data); })
        .def_property_readonly("stderr", [](const Output& o) { return py::bytes(o.stderr_data); });

    py::class_<Child>(m, "Child")
        .def_property_readonly("pid", &Child::pid)
        .def("wait", [](Child& c) {
            ExitStatus status;
            Check(c.Wait(&status));
            return status;
        }, "Wait for the child to exit")
        .def("try_wait", [](Child& c) -> py::object {
            ExitStatus status;
            bool done = false;
            Check(c.TryWait(&status, &done));
            if (!done) return py::none();
            return py::cast(status);
        }, "Exit status if the child has exited, None otherwise")
        .def("wait_with_output", [](Child& c) {
            Output output;
            Check(c.WaitWithOutput(&output));
            return output;
        }, "Collect the piped output and wait for the child")
        .def("kill", [](Child& c) { Check(c.Kill()); })
        .def("signal", [](Child& c, int signum) { Check(c.Signal(signum)); }, py::arg("signum"));

    py::class_<Sandbox>(m, "Sandbox")
        .def(py::init<>())
        .def("add_exception", [](Sandbox& s, const Exception& e) { Check(s.AddException(e)); },
             py::arg("exception"), "Grant an exception")
        .def("spawn", [](Sandbox& s, const Command& command) {
            Child child;
            Check(s.Spawn(command, &child));
            return child;
        }, py::arg("command"), "Run a command inside the sandbox")
        .def("set_implicit_library_reads", &Sandbox::SetImplicitLibraryReads, py::arg("enabled"))
        .def("set_staging_directory", &Sandbox::SetStagingDirectory, py::arg("path"))
        .def("last_warnings", [](const Sandbox& s) {
            std::vector<std::string> res;
            for (const ResolutionWarning& warning : s.LastWarnings()) res.push_back(warning.message);
            return res;
        });

    m.def("enable_log", [](const std::string& path) { Check(TinyCageEnableLog(path)); },
          py::arg("path"), "Set a path where to store the log");
    m.def("get_last_error_msg", []() -> std::string { return std::string(TinyCageGetErrorMsg()); });
    m.def("get_last_error_code", &TinyCageGetErrorCode);
}
