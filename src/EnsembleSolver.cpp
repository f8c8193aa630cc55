//==============================================================================
// EnsembleSolver.cpp
// Execution of descriptor ensembles on Serial / OpenMP / MPI / Hybrid backends.
// Responsibilities:
//   • Build each subproblem from the template through the strategy.
//   • Integrate with one shared, stateless ODEStepper.
//   • Extract records and place (or reduce) them by their structured key.
//   • Collect failures; raise IntegrationError in fail-fast mode.
//==============================================================================

#include "EnsembleSolver.hpp"
#include "Errors.hpp"

EnsembleSolver::EnsembleSolver(const EnsembleOptions& optionsIn)
    : options(optionsIn)
{
}

//------------------------------------------------------------------------------
// runSubproblem: one build → solve → extract pass. A throwing vector field or
// descriptor marks the subproblem failed with the exception text.
//------------------------------------------------------------------------------
bool EnsembleSolver::runSubproblem(const EnsembleProblem& ens, const ODEStepper& stepper, size_t i,
                                   OutputRecord& record, std::string& message) const
{
    const SubproblemStrategy& strategy = *ens.strategy;

    try
    {
        ODEProblem sub = strategy.build(ens.prob, i);
        Trajectory sol = stepper.solve(sub);
        record  = strategy.extract(sol, i);
        message = sol.message;
        return sol.success;
    }
    catch (const std::exception& e)
    {
        Trajectory failed(ens.prob);
        record  = strategy.extract(failed, i);
        message = e.what();
        return false;
    }
}

void EnsembleSolver::assemble(const EnsembleProblem& ens, DescriptorField& field,
                              const OutputRecord& record, size_t i) const
{
    const SubproblemKey key = ens.strategy->key(i);

    if (ens.strategy->hasReduction())
    {
        ens.strategy->reduce(field, record, key);
    }
    else
    {
        field[key.pairIndex] = record;
    }
}

void EnsembleSolver::checkFailures(const EnsembleSolution& solution, size_t numSubproblems) const
{
    if (!options.failFast || solution.failed.empty())
    {
        return;
    }

    std::ostringstream msg;
    msg << solution.failed.size() << " of " << numSubproblems << " subproblems failed:";
    for (size_t j=0; j<solution.failed.size(); ++j)
    {
        msg << " [" << solution.failed[j] << "] " << solution.messages[j];
    }
    throw IntegrationError(msg.str(), solution.failed);
}

#if defined(USE_MPI) || defined(USE_HYBRID)
//------------------------------------------------------------------------------
// solve (MPI/Hybrid)
// Rank r handles i = r, r+size, ... Each record is packed as
// [hasF, lfwd, hasB, lbwd, valid] into a zero buffer; MPI_Allreduce(SUM)
// leaves every rank with all records (0 + x = x, also for NaN), which are
// then assembled in index order so every rank holds the same field.
//------------------------------------------------------------------------------
EnsembleSolution EnsembleSolver::solve(const EnsembleProblem& ens) const
{
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const size_t n = ens.numSubproblems();
    const ODEStepper stepper(ens.integratorOptions);

    vec_real localBuf(5*n, 0.0), globalBuf(5*n, 0.0);
    std::vector<std::string> localMessages(n);

    auto toc_outer = std::chrono::high_resolution_clock::now();

    #ifdef USE_HYBRID
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long i=rank; i<static_cast<long long>(n); i+=size)
    {
        const size_t idx = static_cast<size_t>(i);
        OutputRecord record;
        bool ok = runSubproblem(ens, stepper, idx, record, localMessages[idx]);

        localBuf[5*idx]   = record.lfwd ? 1.0 : 0.0;
        localBuf[5*idx+1] = record.lfwd ? *record.lfwd : 0.0;
        localBuf[5*idx+2] = record.lbwd ? 1.0 : 0.0;
        localBuf[5*idx+3] = record.lbwd ? *record.lbwd : 0.0;
        localBuf[5*idx+4] = (ok && record.valid) ? 1.0 : 0.0;

        if (options.verbose && !ok)
        {
            #ifdef USE_HYBRID
            #pragma omp critical
            #endif
            std::cerr << "ERROR for rank:" << rank << ", subproblem " << idx << " failed: "
                      << localMessages[idx] << std::endl;
        }
    }

    MPI_Allreduce(localBuf.data(), globalBuf.data(), static_cast<int>(5*n), MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD);

    EnsembleSolution solution;
    solution.field = DescriptorField(ens.numRecords());

    for (size_t i=0; i<n; ++i)
    {
        OutputRecord record;
        if (globalBuf[5*i]   != 0.0) record.lfwd = globalBuf[5*i+1];
        if (globalBuf[5*i+2] != 0.0) record.lbwd = globalBuf[5*i+3];
        record.valid = globalBuf[5*i+4] != 0.0;

        if (!record.valid)
        {
            solution.failed.push_back(i);
            solution.messages.push_back(localMessages[i].empty()
                                        ? "failed on rank " + std::to_string(static_cast<int>(i % size))
                                        : localMessages[i]);
        }

        assemble(ens, solution.field, record, i);
    }

    auto tic_outer = std::chrono::high_resolution_clock::now();
    if (rank == 0 && options.verbose)
    {
        std::cout << "Ensemble of " << n << " subproblems solved on " << size << " ranks in "
                  << static_cast<real_t>((tic_outer-toc_outer).count()) / 1e9 << " s." << std::endl;
    }

    checkFailures(solution, n);
    return solution;
}
#else
//------------------------------------------------------------------------------
// solve (Serial/OpenMP)
// OpenMP: records of distinct indices land in distinct slots; only reduce()
// touches shared pair records and runs under `omp critical`. Failures are
// gathered per index and sorted afterwards.
//------------------------------------------------------------------------------
EnsembleSolution EnsembleSolver::solve(const EnsembleProblem& ens) const
{
    const size_t n = ens.numSubproblems();
    const ODEStepper stepper(ens.integratorOptions);

    EnsembleSolution solution;
    solution.field = DescriptorField(ens.numRecords());
    std::vector<std::string> messages(n);
    std::vector<char> ok(n, 1);

    auto toc_outer = std::chrono::high_resolution_clock::now();

    #if defined(USE_OPENMP)
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long i=0; i<static_cast<long long>(n); ++i)
    {
        const size_t idx = static_cast<size_t>(i);
        auto toc_inner = std::chrono::high_resolution_clock::now();

        OutputRecord record;
        ok[idx] = runSubproblem(ens, stepper, idx, record, messages[idx]) ? 1 : 0;

        if (ens.strategy->hasReduction())
        {
            #if defined(USE_OPENMP)
            #pragma omp critical
            #endif
            assemble(ens, solution.field, record, idx);
        }
        else
        {
            assemble(ens, solution.field, record, idx);
        }

        if (options.verbose)
        {
            auto tic_inner = std::chrono::high_resolution_clock::now();
            const SubproblemKey key = ens.strategy->key(idx);
            #if defined(USE_OPENMP)
            #pragma omp critical
            {
                std::cout << "Subproblem " << idx+1 << "/" << n << " (entry " << key.pairIndex
                          << ", " << to_string(key.branch) << ") by thread " << omp_get_thread_num()
                          << " in " << static_cast<real_t>((tic_inner-toc_inner).count()) / 1e9
                          << " s." << (ok[idx] ? "" : " FAILED: " + messages[idx]) << std::endl;
            }
            #else
            std::cout << "Subproblem " << idx+1 << "/" << n << " (entry " << key.pairIndex
                      << ", " << to_string(key.branch) << ") in "
                      << static_cast<real_t>((tic_inner-toc_inner).count()) / 1e9
                      << " s." << (ok[idx] ? "" : " FAILED: " + messages[idx]) << std::endl;
            #endif
        }
    }

    for (size_t i=0; i<n; ++i)
    {
        if (!ok[i])
        {
            solution.failed.push_back(i);
            solution.messages.push_back(messages[i]);
        }
    }

    auto tic_outer = std::chrono::high_resolution_clock::now();
    if (options.verbose)
    {
        std::cout << "Ensemble of " << n << " subproblems solved in "
                  << static_cast<real_t>((tic_outer-toc_outer).count()) / 1e9
                  << " s." << std::endl << std::endl;
    }

    checkFailures(solution, n);
    return solution;
}
#endif
