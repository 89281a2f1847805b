#include <hpx/hpx_init.hpp>
//
#include <hpx/include/async.hpp>
#include <hpx/include/runtime.hpp>
#include <hpx/include/threadmanager.hpp>
#include <hpx/runtime/resource/partitioner.hpp>
#include <hpx/runtime/threads/executors/pool_executor.hpp>
//
#include <hpx/include/iostreams.hpp>
//
#include <mandelmap/dispatch_harness.hpp>
#include <mandelmap/errors.hpp>
#include <mandelmap/execution_context.hpp>
#include <mandelmap/hpx_execution_context.hpp>
#include <mandelmap/intensity.hpp>
#include <mandelmap/opencv_execution_context.hpp>
//
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
//
#include <opencv2/core.hpp>

///////////////////////////////////////////////////////////////////////////
/// Global Variables (Parameters)
static const std::string blocking_tp_name("blocking");

///////////////////////////////////////////////////////////////////////////
/// Function Declarations

std::unique_ptr<mandelmap::ExecutionContext> make_context(
    const std::string& backend, std::size_t chunk_size, double nstripes);

void print_system_params();

void add_pus_to_pool(hpx::resource::partitioner& rp,
    const std::string& pool_name, int num_pus);

///////////////////////////////////////////////////////////////////////////
/// Function Definitions

std::unique_ptr<mandelmap::ExecutionContext> make_context(
    const std::string& backend, std::size_t chunk_size, double nstripes)
{
    if (backend == "hpx")
        return std::unique_ptr<mandelmap::ExecutionContext>(
            new mandelmap::HpxExecutionContext("default", chunk_size));
    if (backend == "opencv")
        return std::unique_ptr<mandelmap::ExecutionContext>(
            new mandelmap::OpenCVExecutionContext(nstripes));
    if (backend == "sequential")
        return std::unique_ptr<mandelmap::ExecutionContext>(
            new mandelmap::SequentialExecutionContext());

    throw mandelmap::configuration_error("unknown backend '" + backend +
        "', expected hpx, opencv or sequential");
}

void print_system_params()
{
    // print partition characteristics
    hpx::cout << "\n\n"
              << "[hpx_main] print resource_partitioner characteristics : "
              << "\n";
    hpx::resource::get_partitioner().print_init_pool_data(std::cout);

    // print partition characteristics
    hpx::cout << "\n\n[hpx_main] print thread-manager pools : "
              << "\n";
    hpx::threads::get_thread_manager().print_pools(std::cout);
}

// Hands the first num_pus processing units to pool_name, the rest stays
// with the default pool.
void add_pus_to_pool(hpx::resource::partitioner& rp,
    const std::string& pool_name, int num_pus)
{
    int count = 0;
    for (const hpx::resource::numa_domain& d : rp.numa_domains())
    {
        for (const hpx::resource::core& c : d.cores())
        {
            for (const hpx::resource::pu& p : c.pus())
            {
                if (count >= num_pus)
                    return;

                std::cout << "[main] Added pu " << count++ << " to "
                          << pool_name << " thread pool" << "\n";
                rp.add_resource(p, pool_name);
            }
        }
    }
}

///////////////////////////////////////////////////////////////////////////
int hpx_main(boost::program_options::variables_map& vm)
{
    hpx::cout << "[hpx_main] starting ..." << "\n";

    int width = vm["width"].as<int>();
    int height = vm["height"].as<int>();
    int iterations = vm["iterations"].as<int>();
    std::string backend = vm["backend"].as<std::string>();
    std::string output = vm["output"].as<std::string>();
    bool show = vm.count("show") != 0;

    hpx::cout << "h=" << height << " w=" << width << " backend=" << backend
              << " num_threads=" << hpx::get_num_worker_threads()
              << " iterations=" << iterations << "\n";

    if (vm.count("print-system"))
        print_system_params();

    int exit_code = 0;
    try
    {
        std::unique_ptr<mandelmap::ExecutionContext> context = make_context(
            backend, vm["chunk-size"].as<std::size_t>(),
            vm["nstripes"].as<double>());

        mandelmap::LaunchConfig config;
        config.lane_group_size = vm["lane-group"].as<int>();

        mandelmap::DispatchHarness harness(*context, config);
        if (vm.count("verbose"))
            harness.setLog(&hpx::cout);

        mandelmap::DivergenceMap map =
            harness.run(width, height, iterations);

        hpx::cout << "[hpx_main] max divergence iteration "
                  << map.max_value() << "\n";

        cv::Mat image = mandelmap::to_intensity(map);

        // imwrite and imshow block, keep them off the default pool
        hpx::threads::executors::pool_executor blocking_executor(
            blocking_tp_name);

        std::vector<hpx::future<void>> blocking_calls;
        if (!output.empty())
        {
            blocking_calls.push_back(hpx::async(blocking_executor,
                &mandelmap::save_image, image, output));
        }
        if (show)
        {
            blocking_calls.push_back(hpx::async(blocking_executor,
                &mandelmap::show_image, image, std::string("Mandelbrot")));
        }
        for (hpx::future<void>& f : blocking_calls)
            f.get();
    }
    catch (const mandelmap::error& e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        exit_code = 1;
    }
    catch (const std::exception& e)
    {
        // image output and display failures, cv::Exception included
        std::cerr << "ERROR: " << e.what() << "\n";
        exit_code = 1;
    }

    hpx::finalize();
    return exit_code;
}

///////////////////////////////////////////////////////////////////////////
int main(int argc, char* argv[])
{
    namespace po = boost::program_options;
    po::options_description desc_cmdline("Options");
    desc_cmdline.add_options()
        ("width", po::value<int>()->default_value(1152),
         "Number of grid columns")
        ("height", po::value<int>()->default_value(768),
         "Number of grid rows")
        ("iterations,i", po::value<int>()->default_value(100),
         "Maximum number of orbit iterations per grid point")
        ("backend,b", po::value<std::string>()->default_value("hpx"),
         "Execution context: hpx, opencv or sequential")
        ("chunk-size", po::value<std::size_t>()->default_value(0),
         "Static chunk size of the hpx backend (0 picks one)")
        ("lane-group", po::value<int>()->default_value(0),
         "Pad the launch range to a multiple of this many lanes")
        ("nstripes,n", po::value<double>()->default_value(-1.),
         "Value of OpenCV nstripe parameter for the opencv backend")
        ("output,o", po::value<std::string>()->default_value(""),
         "Write the normalized image to this file")
        ("show", "Display the normalized image in a window")
        ("blocking_tp_num_threads,m", po::value<int>()->default_value(1),
         "Number of threads to assign to the blocking pool")
        ("print-system", "Print thread pool layout")
        ("verbose", "Log launch geometry and execution time");

    // HPX uses a boost program options variable map, but we need it before
    // hpx-main, so we will create another one here and throw it away after use
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv)
                      .allow_unregistered()
                      .options(desc_cmdline)
                      .run(),
            vm);
    }
    catch (po::error& e)
    {
        std::cerr << "ERROR: " << e.what() << "\n" << "\n";
        std::cerr << desc_cmdline << "\n";
        return -1;
    }

    int blocking_tp_num_threads = vm["blocking_tp_num_threads"].as<int>();

    // Create the resource partitioner
    hpx::resource::partitioner rp(desc_cmdline, argc, argv);
    std::cout << "[main] obtained reference to the resource_partitioner"
              << "\n";

    rp.create_thread_pool("default",
        hpx::resource::scheduling_policy::local_priority_fifo);
    rp.create_thread_pool(blocking_tp_name,
        hpx::resource::scheduling_policy::local_priority_fifo);

    std::cout << "[main] thread pool " << blocking_tp_name << " created"
              << "\n";

    add_pus_to_pool(rp, blocking_tp_name, blocking_tp_num_threads);

    return hpx::init(desc_cmdline, argc, argv);
}
