#include "Checkpoint.hpp"

#include <hdf5.h>

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace Kilonova {

namespace {
    constexpr hsize_t NUM_FIELDS = 5;

    /// Owns an HDF5 identifier; a negative id means the call that made it failed.
    class H5Handle {
    public:
        H5Handle(hid_t id, herr_t (*close)(hid_t), const std::string& what)
            : id_(id), close_(close)
        {
            if (id_ < 0)
                throw std::runtime_error("CheckpointIO: " + what);
        }
        ~H5Handle() { close_(id_); }

        H5Handle(const H5Handle&) = delete;
        H5Handle& operator=(const H5Handle&) = delete;

        hid_t id() const { return id_; }

    private:
        hid_t id_;
        herr_t (*close_)(hid_t);
    };

    void check(herr_t status, const std::string& what) {
        if (status < 0)
            throw std::runtime_error("CheckpointIO: " + what);
    }

    template <typename T>
    void writeAttribute(hid_t obj, const char* name, hid_t fileType, hid_t memType, const T& value) {
        H5Handle space(H5Screate(H5S_SCALAR), H5Sclose, "dataspace for " + std::string(name));
        H5Handle attr(H5Acreate2(obj, name, fileType, space.id(), H5P_DEFAULT, H5P_DEFAULT),
                      H5Aclose, "cannot create attribute " + std::string(name));
        check(H5Awrite(attr.id(), memType, &value), "cannot write attribute " + std::string(name));
    }

    template <typename T>
    T readAttribute(hid_t obj, const char* name, hid_t memType) {
        H5Handle attr(H5Aopen(obj, name, H5P_DEFAULT), H5Aclose,
                      "missing attribute " + std::string(name));
        T value{};
        check(H5Aread(attr.id(), memType, &value), "cannot read attribute " + std::string(name));
        return value;
    }

    void writeTask(hid_t tasks, const char* name, const RecurringTask& task) {
        H5Handle group(H5Gcreate2(tasks, name, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                       H5Gclose, "cannot create group tasks/" + std::string(name));
        writeAttribute(group.id(), "count", H5T_STD_U64LE, H5T_NATIVE_UINT64,
                       static_cast<std::uint64_t>(task.count()));
        writeAttribute(group.id(), "nextTime", H5T_IEEE_F64LE, H5T_NATIVE_DOUBLE, task.nextTime());
    }

    RecurringTask readTask(hid_t tasks, const char* name) {
        H5Handle group(H5Gopen2(tasks, name, H5P_DEFAULT), H5Gclose,
                       "missing group tasks/" + std::string(name));
        auto count = readAttribute<std::uint64_t>(group.id(), "count", H5T_NATIVE_UINT64);
        auto nextTime = readAttribute<double>(group.id(), "nextTime", H5T_NATIVE_DOUBLE);
        return RecurringTask(count, nextTime);
    }

    long parseRadial(const std::string& name) {
        long radial = 0;
        auto [end, ec] = std::from_chars(name.data(), name.data() + name.size(), radial);
        if (ec != std::errc() || end != name.data() + name.size())
            throw std::runtime_error("CheckpointIO: unexpected dataset blocks/" + name);
        return radial;
    }
} // anonymous namespace

void CheckpointIO::write(const std::string& filename,
                         const SolutionState& state,
                         const Tasks& tasks)
{
    auto parent = std::filesystem::path(filename).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent);

    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    H5Handle file(H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT),
                  H5Fclose, "cannot create " + filename);

    writeAttribute(file.id(), "iteration", H5T_STD_U64LE, H5T_NATIVE_UINT64,
                   static_cast<std::uint64_t>(state.iteration()));
    writeAttribute(file.id(), "time", H5T_IEEE_F64LE, H5T_NATIVE_DOUBLE, state.time());

    {
        H5Handle group(H5Gcreate2(file.id(), "tasks", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                       H5Gclose, "cannot create group tasks");
        writeTask(group.id(), "writeCheckpoint", tasks.writeCheckpoint);
        writeTask(group.id(), "writeProducts", tasks.writeProducts);
        writeTask(group.id(), "iterationMessage", tasks.iterationMessage);
        writeTask(group.id(), "reportProgress", tasks.reportProgress);
    }

    H5Handle blocks(H5Gcreate2(file.id(), "blocks", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                    H5Gclose, "cannot create group blocks");

    for (const auto& [index, data] : state.solution()) {
        std::vector<double> buffer;
        buffer.reserve(data.size() * NUM_FIELDS);
        for (const auto& U : data)
            buffer.insert(buffer.end(), {U.mass, U.momR, U.momQ, U.energy, U.scalar});

        std::string name = std::to_string(index.radial);
        hsize_t dims[2] = {static_cast<hsize_t>(data.size()), NUM_FIELDS};
        H5Handle space(H5Screate_simple(2, dims, nullptr), H5Sclose, "dataspace for block " + name);
        H5Handle dset(H5Dcreate2(blocks.id(), name.c_str(), H5T_IEEE_F64LE, space.id(),
                                 H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                      H5Dclose, "cannot create blocks/" + name);
        check(H5Dwrite(dset.id(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()),
              "cannot write blocks/" + name);
    }

    check(H5Fflush(file.id(), H5F_SCOPE_GLOBAL), "failed writing " + filename);
}

Checkpoint CheckpointIO::read(const std::string& filename) {
    if (!std::filesystem::exists(filename))
        throw std::runtime_error("CheckpointIO::read: cannot open " + filename);

    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    if (H5Fis_hdf5(filename.c_str()) <= 0)
        throw std::runtime_error("CheckpointIO::read: " + filename + " is not a checkpoint");

    H5Handle file(H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT),
                  H5Fclose, "cannot open " + filename);

    auto iteration = readAttribute<std::uint64_t>(file.id(), "iteration", H5T_NATIVE_UINT64);
    auto time = readAttribute<double>(file.id(), "time", H5T_NATIVE_DOUBLE);

    Checkpoint chk;
    {
        H5Handle group(H5Gopen2(file.id(), "tasks", H5P_DEFAULT), H5Gclose, "missing group tasks");
        chk.tasks.writeCheckpoint = readTask(group.id(), "writeCheckpoint");
        chk.tasks.writeProducts = readTask(group.id(), "writeProducts");
        chk.tasks.iterationMessage = readTask(group.id(), "iterationMessage");
        chk.tasks.reportProgress = readTask(group.id(), "reportProgress");
    }

    H5Handle blocks(H5Gopen2(file.id(), "blocks", H5P_DEFAULT), H5Gclose, "missing group blocks");
    H5G_info_t info;
    check(H5Gget_info(blocks.id(), &info), "cannot list blocks in " + filename);

    SolutionState::BlockMap solution;
    for (hsize_t k = 0; k < info.nlinks; ++k) {
        ssize_t length = H5Lget_name_by_idx(blocks.id(), ".", H5_INDEX_NAME, H5_ITER_INC,
                                            k, nullptr, 0, H5P_DEFAULT);
        if (length < 0)
            throw std::runtime_error("CheckpointIO::read: cannot list blocks in " + filename);
        std::vector<char> buf(static_cast<std::size_t>(length) + 1, '\0');
        if (H5Lget_name_by_idx(blocks.id(), ".", H5_INDEX_NAME, H5_ITER_INC,
                               k, buf.data(), buf.size(), H5P_DEFAULT) < 0)
            throw std::runtime_error("CheckpointIO::read: cannot list blocks in " + filename);
        std::string name(buf.data());

        H5Handle dset(H5Dopen2(blocks.id(), name.c_str(), H5P_DEFAULT), H5Dclose,
                      "cannot open blocks/" + name);
        H5Handle space(H5Dget_space(dset.id()), H5Sclose, "no dataspace for blocks/" + name);

        hsize_t dims[2] = {0, 0};
        if (H5Sget_simple_extent_ndims(space.id()) != 2
            || H5Sget_simple_extent_dims(space.id(), dims, nullptr) < 0
            || dims[1] != NUM_FIELDS)
            throw std::runtime_error("CheckpointIO::read: blocks/" + name + " has the wrong shape");

        std::vector<double> buffer(static_cast<std::size_t>(dims[0] * NUM_FIELDS));
        check(H5Dread(dset.id(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()),
              "cannot read blocks/" + name);

        SolutionState::BlockData data(static_cast<std::size_t>(dims[0]));
        for (std::size_t c = 0; c < data.size(); ++c) {
            const double* v = &buffer[c * NUM_FIELDS];
            data[c].mass = v[0];
            data[c].momR = v[1];
            data[c].momQ = v[2];
            data[c].energy = v[3];
            data[c].scalar = v[4];
        }
        solution.emplace(BlockIndex(parseRadial(name)), std::move(data));
    }

    chk.state = SolutionState(iteration, time, std::move(solution));
    return chk;
}

} // namespace Kilonova
