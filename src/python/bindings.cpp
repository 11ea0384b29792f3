// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "PotentialFlow/core/Simulation.hpp"
#include "PotentialFlow/utils/Config.hpp"
#include "PotentialFlow/common/Types.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/Profiler.hpp"
#include "PotentialFlow/field/EvaluatorSelection.hpp"

namespace pybind11
{
    namespace detail
    {

        // --- add support for glm::vec3 type---
        template <>
        struct type_caster<pflow::vec3_t>
        {
        public:
            bool load(handle src, bool)
            {
                if (isinstance<sequence>(src) && !isinstance<array>(src))
                {
                    auto seq = reinterpret_borrow<sequence>(src);
                    if (seq.size() != 3)
                    {
                        return false;
                    }
                    value = pflow::vec3_t(seq[0].cast<pflow::real>(), seq[1].cast<pflow::real>(), seq[2].cast<pflow::real>());
                    return true;
                }
                if (!isinstance<array>(src))
                {
                    return false;
                }
                auto arr_untyped = reinterpret_borrow<array>(src);

                if (arr_untyped.ndim() != 1 || arr_untyped.size() != 3)
                {
                    return false;
                }

                auto arr = array_t<pflow::real>::ensure(arr_untyped);
                if (!arr)
                {
                    return false;
                }
                value = pflow::vec3_t(arr.at(0), arr.at(1), arr.at(2));
                return true;
            }

            static handle cast(const pflow::vec3_t &src, return_value_policy, handle)
            {
                return pybind11::array_t<pflow::real>(3, &src.x).release();
            }

            PYBIND11_TYPE_CASTER(pflow::vec3_t, _("numpy.ndarray[pflow::real[3]]"));
        };

    }
} // namespace pybind11::detail

namespace
{
    using FloatArray = pybind11::array_t<float, pybind11::array::c_style | pybind11::array::forcecast>;

    // (N, 3) view of an interleaved buffer, copied
    FloatArray toPointArray(const pflow::FlatBuffer &buffer, std::size_t count)
    {
        FloatArray out({static_cast<pybind11::ssize_t>(count), static_cast<pybind11::ssize_t>(3)});
        std::copy(buffer.begin(), buffer.begin() + count * 3, out.mutable_data());
        return out;
    }

    std::size_t checkPointArray(const FloatArray &points, const char *what)
    {
        if (points.ndim() != 2 || points.shape(1) != 3)
        {
            throw std::invalid_argument(std::string(what) + " must have shape (N, 3).");
        }
        return static_cast<std::size_t>(points.shape(0));
    }
} // namespace

PYBIND11_MODULE(potential_flow, m)
{
    m.doc() = "Analytic potential-flow wind tunnel with particle advection";

    pflow::Logger::initConsole("warn");

    pybind11::register_exception<pflow::field::EvaluatorError>(m, "EvaluatorError", PyExc_RuntimeError);

    pybind11::enum_<pflow::ObstacleKind>(m, "ObstacleKind")
        .value("Sphere", pflow::ObstacleKind::Sphere)
        .value("Cylinder", pflow::ObstacleKind::Cylinder)
        .value("Airfoil", pflow::ObstacleKind::Airfoil);

    pybind11::enum_<pflow::flow::SliceAxis>(m, "SliceAxis")
        .value("None_", pflow::flow::SliceAxis::None)
        .value("X", pflow::flow::SliceAxis::X)
        .value("Y", pflow::flow::SliceAxis::Y)
        .value("Z", pflow::flow::SliceAxis::Z);

    pybind11::enum_<pflow::flow::FieldMode>(m, "FieldMode")
        .value("None_", pflow::flow::FieldMode::None)
        .value("Velocity", pflow::flow::FieldMode::Velocity)
        .value("Pressure", pflow::flow::FieldMode::Pressure);

    pybind11::enum_<pflow::field::EvaluatorBackend>(m, "EvaluatorBackend")
        .value("Auto", pflow::field::EvaluatorBackend::Auto)
        .value("Batch", pflow::field::EvaluatorBackend::Batch)
        .value("Scalar", pflow::field::EvaluatorBackend::Scalar);

    pybind11::class_<pflow::flow::Tunnel>(m, "Tunnel")
        .def(pybind11::init<>())
        .def_readwrite("entry_x", &pflow::flow::Tunnel::entry_x)
        .def_readwrite("exit_x", &pflow::flow::Tunnel::exit_x)
        .def_readwrite("width", &pflow::flow::Tunnel::width)
        .def_readwrite("height", &pflow::flow::Tunnel::height);

    pybind11::class_<pflow::SliceConfig>(m, "SliceConfig")
        .def(pybind11::init<>())
        .def_readwrite("field", &pflow::SliceConfig::field)
        .def_readwrite("axis", &pflow::SliceConfig::axis)
        .def_readwrite("position", &pflow::SliceConfig::position)
        .def_readwrite("resolution", &pflow::SliceConfig::resolution)
        .def_readwrite("refresh_interval", &pflow::SliceConfig::refresh_interval);

    pybind11::class_<pflow::SimulationParameters>(m, "SimulationParameters")
        .def(pybind11::init<>())
        .def_readwrite("free_stream_velocity", &pflow::SimulationParameters::free_stream_velocity)
        .def_readwrite("fluid_density", &pflow::SimulationParameters::fluid_density)
        .def_readwrite("particle_count", &pflow::SimulationParameters::particle_count)
        .def_readwrite("obstacle_type", &pflow::SimulationParameters::obstacle_type)
        .def_readwrite("obstacle_position", &pflow::SimulationParameters::obstacle_position)
        .def_readwrite("tunnel", &pflow::SimulationParameters::tunnel)
        .def_readwrite("evaluator_backend", &pflow::SimulationParameters::evaluator_backend)
        .def_readwrite("max_primary_failures", &pflow::SimulationParameters::max_primary_failures)
        .def_readwrite("validate_output", &pflow::SimulationParameters::validate_output)
        .def_readwrite("random_seed", &pflow::SimulationParameters::random_seed)
        .def_readwrite("total_steps", &pflow::SimulationParameters::total_steps)
        .def_readwrite("output_frequency", &pflow::SimulationParameters::output_frequency)
        .def_readwrite("output_path", &pflow::SimulationParameters::output_path)
        .def_readwrite("log_level", &pflow::SimulationParameters::log_level)
        .def_readwrite("log_file", &pflow::SimulationParameters::log_file)
        .def_readwrite("slice", &pflow::SimulationParameters::slice);

    pybind11::class_<pflow::Config>(m, "Config")
        .def(pybind11::init<>(), "Default constructor")
        .def("load", &pflow::Config::load, pybind11::arg("filepath"), "Load configuration from a JSON file.")
        .def("get_params", &pflow::Config::getParams,
             pybind11::return_value_policy::reference_internal,
             "Get a reference to the loaded simulation parameters.");

    pybind11::class_<pflow::field::FallbackFieldEvaluator>(m, "FieldEvaluator")
        .def(pybind11::init([](pflow::field::EvaluatorBackend backend, bool validate_output, int max_primary_failures)
                            { return pflow::field::createFieldEvaluator(backend, validate_output, max_primary_failures); }),
             pybind11::arg("backend") = pflow::field::EvaluatorBackend::Auto,
             pybind11::arg("validate_output") = true,
             pybind11::arg("max_primary_failures") = 3,
             "Probe the batch kernel and wrap it with the scalar fallback.")
        .def_property_readonly("active_backend", &pflow::field::FallbackFieldEvaluator::activeBackend)
        .def_property_readonly("total_failures", &pflow::field::FallbackFieldEvaluator::totalFailures)
        .def("evaluate", [](const pflow::field::FallbackFieldEvaluator &self, const FloatArray &positions,
                            pflow::real free_stream_velocity, pflow::real fluid_density,
                            pflow::ObstacleKind kind, const pflow::vec3_t &obstacle_position)
             {
            const std::size_t n = checkPointArray(positions, "positions");
            pflow::FlowParameters flow{free_stream_velocity, fluid_density};
            pflow::ObstacleDescriptor obstacle;
            obstacle.kind = kind;
            obstacle.position = obstacle_position;
            FloatArray out({static_cast<pybind11::ssize_t>(n), static_cast<pybind11::ssize_t>(3)});
            self.evaluate(positions.data(), n, flow, obstacle, out.mutable_data());
            return out; },
             pybind11::arg("positions"), pybind11::arg("free_stream_velocity"), pybind11::arg("fluid_density"),
             pybind11::arg("kind"), pybind11::arg("obstacle_position") = pflow::vec3_t(0.0),
             "Velocity at every row of an (N, 3) position array.")
        .def("evaluate_pressure", [](const pflow::field::FallbackFieldEvaluator &self, const FloatArray &velocities,
                                     pflow::real free_stream_velocity, pflow::real fluid_density)
             {
            const std::size_t n = checkPointArray(velocities, "velocities");
            FloatArray out(static_cast<pybind11::ssize_t>(n));
            self.evaluatePressure(velocities.data(), n, free_stream_velocity, fluid_density, out.mutable_data());
            return out; },
             pybind11::arg("velocities"), pybind11::arg("free_stream_velocity"), pybind11::arg("fluid_density"),
             "Bernoulli pressure for every row of an (N, 3) velocity array.");

    pybind11::class_<pflow::Simulation>(m, "Simulation")
        .def(pybind11::init<const pflow::SimulationParameters &>(),
             pybind11::arg("params"),
             "Constructor that takes simulation parameters.")
        .def("initialize", &pflow::Simulation::initialize, "Initialize the simulation environment.")
        .def("reset", &pflow::Simulation::reset, "Reset the simulation environment.")
        .def("step", &pflow::Simulation::step, "Advance one tick.")
        .def("set_free_stream_velocity", &pflow::Simulation::setFreeStreamVelocity, pybind11::arg("velocity"))
        .def("set_fluid_density", &pflow::Simulation::setFluidDensity, pybind11::arg("density"))
        .def("set_obstacle_kind", &pflow::Simulation::setObstacleKind, pybind11::arg("kind"))
        .def("set_obstacle_position", &pflow::Simulation::setObstaclePosition, pybind11::arg("position"))
        .def("set_particle_count", &pflow::Simulation::setParticleCount, pybind11::arg("count"),
             "Reallocate and reseed all particles.")
        .def("set_slice_mode", &pflow::Simulation::setSliceMode, pybind11::arg("mode"))
        .def("set_slice_axis", &pflow::Simulation::setSliceAxis, pybind11::arg("axis"))
        .def("set_slice_position", &pflow::Simulation::setSlicePosition, pybind11::arg("position"))
        .def("set_slice_resolution", &pflow::Simulation::setSliceResolution, pybind11::arg("resolution"))
        .def("save_frame_data", &pflow::Simulation::saveFrameData,
             pybind11::arg("frame_index"),
             "Save simulation data for a given frame.")
        .def_property_readonly("tick_count", &pflow::Simulation::tickCount)
        .def_property_readonly("particle_count", &pflow::Simulation::particleCount)
        .def_property_readonly("active_backend", [](const pflow::Simulation &self)
                               { return std::string(self.evaluator().activeBackend()); })
        .def("get_positions", [](const pflow::Simulation &self)
             { return toPointArray(self.positions(), self.particleCount()); }, "Get the particle positions as an (N, 3) array.")
        .def("get_velocities", [](const pflow::Simulation &self)
             { return toPointArray(self.velocities(), self.particleCount()); }, "Get the particle velocities as an (N, 3) array.")
        .def("get_pressures", [](const pflow::Simulation &self)
             {
            const std::vector<float> p = self.pressures();
            return FloatArray(static_cast<pybind11::ssize_t>(p.size()), p.data()); }, "Get the Bernoulli pressure at every particle.")
        .def("get_slice", [](const pflow::Simulation &self) -> pybind11::object
             {
            const pflow::flow::FieldSlice *slice = self.slice();
            if (slice == nullptr)
            {
                return pybind11::none();
            }
            pybind11::dict d;
            d["points"] = toPointArray(slice->points(), slice->pointCount());
            d["colors"] = toPointArray(slice->colors(), slice->pointCount());
            d["values"] = FloatArray(static_cast<pybind11::ssize_t>(slice->values().size()), slice->values().data());
            d["range"] = pybind11::make_tuple(slice->rangeMin(), slice->rangeMax());
            d["resolution"] = slice->resolution();
            pybind11::list outline;
            for (const auto &p : slice->outline())
            {
                outline.append(pybind11::make_tuple(p.x, p.y, p.z));
            }
            d["outline"] = outline;
            return d; }, "Get the current field slice as a dict, or None.")
        .def("begin_profiler", [](pflow::Simulation &, std::string name)
             { PROFILE_SESSION(name); }, "Activate the built-in profiler.")
        .def("end_profiler", [](pflow::Simulation &)
             { PROFILE_END_SESSION(); }, "End the profiling session and output results.");
}
