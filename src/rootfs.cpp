#include "stage.hpp"
#include "util/log.hpp"

/*
 * Root directory is opened once and entered through the descriptor.
 * Working directory is normalized lexically and resolved inside new root,
 * so neither ".." nor relative path could leave it.
 */
TError EnterRoot(std::unique_ptr<TFinalized> finalized,
                 std::unique_ptr<TRooted> &result) {
    TStageContext ctx = finalized->Context();
    TKernel &kernel = finalized->Kernel();
    auto &cfg = ctx.Config();
    TError error;

    if (cfg.ChrootDir) {
        TPath cwd = cfg.WorkingDir ? cfg.WorkingDir.NormalPath() : TPath("/");

        error = kernel.Chroot(cfg.ChrootDir);
        if (error)
            return TError(EError::ChrootFailed, error, "Cannot chroot {}", cfg.ChrootDir);

        /* never keep working directory outside of root */
        error = kernel.Chdir(cwd);
        if (error)
            return TError(EError::ChdirFailed, error, "Cannot chdir {} inside {}",
                          cwd, cfg.ChrootDir);
    } else if (cfg.WorkingDir) {
        error = kernel.Chdir(cfg.WorkingDir);
        if (error)
            return TError(EError::ChdirFailed, error, "Cannot chdir {}", cfg.WorkingDir);
    }

    result.reset(new TRooted(ctx));
    return OK;
}
